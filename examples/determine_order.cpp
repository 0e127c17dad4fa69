#include "dataset_normalizer.hpp"
#include "kinetic_evaluator.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

// Usage: determine_order <table-file> [comma|tab|whitespace] [--header]
int
main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <table-file> [comma|tab|whitespace] [--header]" << '\n';
        return 2;
    }

    rate_order::NormalizerOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "comma") {
            options.delimiter = rate_order::Delimiter::Comma;
        } else if (arg == "tab") {
            options.delimiter = rate_order::Delimiter::Tab;
        } else if (arg == "whitespace") {
            options.delimiter = rate_order::Delimiter::Whitespace;
        } else if (arg == "--header") {
            options.skip_header = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            return 2;
        }
    }

    std::ifstream file(argv[1]);
    if (!file) {
        std::cerr << "Cannot open " << argv[1] << '\n';
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        rate_order::SampleSet const samples = rate_order::parse_samples(buffer.str(), options);
        std::cout << "Read " << samples.size() << " samples from " << argv[1] << '\n';
        std::cout << rate_order::evaluate(samples) << '\n';
    } catch (const rate_order::ParseError &e) {
        std::cerr << e.what() << '\n';
        return 1;
    } catch (const rate_order::InsufficientDataError &e) {
        std::cerr << "Warning: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
