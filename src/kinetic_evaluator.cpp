#include "kinetic_evaluator.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace rate_order {

namespace {

// Avoids printing "-0.0000" for values that round to zero.
double
suppress_negative_zero(double value, int precision) {
    return std::abs(value) < 0.5 * std::pow(10.0, -precision) ? 0.0 : value;
}

} // namespace

std::string
format_equation(const OrderModel &model, double intercept, double slope, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision);
    ss << model.axis_label << " = " << suppress_negative_zero(intercept, precision);
    ss << (slope < 0.0 ? " - " : " + ") << suppress_negative_zero(std::abs(slope), precision) << " t";
    return ss.str();
}

KineticFitResult
fit_order(const OrderModel &model, const SampleSet &samples, const EvaluatorOptions &options) {
    KineticFitResult result;
    result.order = model.order;
    result.linear_label = model.linear_label;

    std::vector<double> t;
    std::vector<double> y;
    t.reserve(samples.size());
    y.reserve(samples.size());
    for (const auto &s : samples) {
        if (!std::isfinite(s.time) || !model.accepts(s.concentration)) { continue; }
        t.push_back(s.time);
        y.push_back(model.transform(s.concentration));
    }
    result.sample_count = t.size();

    if (t.size() < 2) {
        if (options.verbose) {
            std::cerr << "[KineticEvaluator] Warning: " << model.name << " has " << t.size()
                      << " usable sample(s); R^2 set to 0." << std::endl;
        }
        result.equation = model.axis_label + " = undefined";
        return result;
    }

    const RegressionResult fit = ols_fit(t, y);
    result.slope = fit.slope;
    result.intercept = fit.intercept;
    result.r_squared = fit.r_squared;
    result.rate_constant = model.rate_constant(fit.slope);
    result.equation = format_equation(model, fit.intercept, fit.slope, options.equation_precision);
    result.valid = true;

    if (options.verbose) {
        if (fit.r_squared == 0.0) {
            std::cerr << "[KineticEvaluator] Warning: " << model.name
                      << " fit is degenerate (zero variance); R^2 set to 0." << std::endl;
        }
        std::cout << "[KineticEvaluator] " << model.name << ": n=" << fit.n << ", R^2=" << fit.r_squared
                  << ", k=" << result.rate_constant << " " << model.rate_units << std::endl;
    }
    return result;
}

ReactionOrder
select_best(const std::array<KineticFitResult, kNumReactionOrders> &fits) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < fits.size(); ++i) {
        if (fits[i].r_squared > fits[best].r_squared) { best = i; }
    }
    return fits[best].order;
}

KineticAnalysis
evaluate(const SampleSet &samples, const EvaluatorOptions &options) {
    if (samples.size() < 2) { throw InsufficientDataError(samples.size()); }

    if (options.verbose) {
        std::cout << "[KineticEvaluator] Evaluating " << samples.size() << " samples." << std::endl;
    }

    KineticAnalysis analysis;
    for (const auto &model : order_models()) {
        analysis.fits[order_index(model.order)] = fit_order(model, samples, options);
    }
    analysis.best = select_best(analysis.fits);

    if (options.verbose) { std::cout << "[KineticEvaluator] Best fit: " << analysis.best << std::endl; }
    return analysis;
}

std::string
format_report(const KineticAnalysis &analysis, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision);
    ss << std::left << std::setw(14) << "Order" << std::setw(12) << "R^2" << std::setw(22) << "k"
       << "Equation" << '\n';
    for (const auto &model : order_models()) {
        const KineticFitResult &fit = analysis.fit(model.order);
        std::ostringstream k_text;
        k_text << std::fixed << std::setprecision(precision + 1);
        if (fit.valid) {
            k_text << fit.rate_constant << " " << model.rate_units;
        } else {
            k_text << "n/a";
        }
        ss << std::setw(14) << model.name << std::setw(12) << fit.r_squared << std::setw(22) << k_text.str()
           << fit.equation << '\n';
    }

    const OrderModel &best_model = order_model(analysis.best);
    const KineticFitResult &best = analysis.best_fit();
    ss << "Best fit: " << best_model.name << " (R^2 = " << best.r_squared << ", k = "
       << std::setprecision(precision + 1) << best.rate_constant << " " << best_model.rate_units << ")";
    return ss.str();
}

std::ostream &
operator<<(std::ostream &os, const KineticAnalysis &analysis) {
    os << format_report(analysis);
    return os;
}

} // namespace rate_order
