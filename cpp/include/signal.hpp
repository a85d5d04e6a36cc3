#pragma once

#include "NumCpp.hpp"
#include "extrapolation.hpp"
#include "interpolation.hpp"

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace chromat {
namespace continuous {

enum class ArithmeticOperator { Add, Subtract, Multiply, Divide, Power };

// Accepts "+", "-", "*", "/", "**" and the operator names.
ArithmeticOperator parse_arithmetic_operator(const std::string& symbol);
std::string to_string(ArithmeticOperator op);
double apply_operator(double a, double b, ArithmeticOperator op);

enum class FillNanMethod { Interpolation, Constant };

FillNanMethod parse_fill_nan_method(const std::string& name);

/**
 * @brief Continuous signal defined by samples domain[i] -> range[i].
 *
 * The domain is strictly increasing. The interpolator and the extrapolator
 * wrapping it are rebuilt after every mutation, so an invalid configuration
 * throws at construction or assignment. Values inside the domain envelope
 * come from the interpolator, values outside from the extrapolator.
 */
class Signal {
public:
    Signal();
    explicit Signal(const nc::NdArray<double>& range,
                    const nc::NdArray<double>& domain = nc::NdArray<double>(),
                    const std::string& name = "",
                    const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
                    const algebra::ExtrapolatorSettings& extrapolator = default_extrapolator_settings());
    explicit Signal(const std::map<double, double>& data,
                    const std::string& name = "",
                    const algebra::InterpolatorSettings& interpolator = algebra::InterpolatorSettings(),
                    const algebra::ExtrapolatorSettings& extrapolator = default_extrapolator_settings());

    // Constant extrapolation with NaN on both sides.
    static algebra::ExtrapolatorSettings default_extrapolator_settings();

    const std::string& name() const { return m_name; }
    void set_name(const std::string& name) { m_name = name; }

    // 1 x n rows
    nc::NdArray<double> domain() const;
    nc::NdArray<double> range() const;
    const std::vector<double>& domain_values() const { return m_domain; }
    const std::vector<double>& range_values() const { return m_range; }

    // A domain of a different size resizes the range cyclically.
    void set_domain(const nc::NdArray<double>& domain);
    // An empty domain becomes 0..n-1; otherwise the sizes must match.
    void set_range(const nc::NdArray<double>& range);
    void set_data(const std::vector<double>& domain, const std::vector<double>& range);

    const algebra::InterpolatorSettings& interpolator_settings() const { return m_interpolator_settings; }
    void set_interpolator_settings(const algebra::InterpolatorSettings& settings);
    const algebra::ExtrapolatorSettings& extrapolator_settings() const { return m_extrapolator_settings; }
    void set_extrapolator_settings(const algebra::ExtrapolatorSettings& settings);

    // Null for signals with fewer than two samples.
    std::shared_ptr<const algebra::Extrapolator> function() const { return m_function; }

    std::size_t size() const { return m_domain.size(); }
    bool empty() const { return m_domain.empty(); }

    double evaluate(double x) const;
    nc::NdArray<double> evaluate(const nc::NdArray<double>& x) const;

    double operator[](double x) const { return evaluate(x); }
    nc::NdArray<double> operator[](const nc::NdArray<double>& x) const { return evaluate(x); }
    nc::NdArray<double> operator[](const nc::Slice& indexes) const;

    // Updates matching domain values, inserts the others (last write wins).
    void set_item(double x, double y);
    void set_item(const nc::NdArray<double>& x, const nc::NdArray<double>& y);
    void set_item(const nc::NdArray<double>& x, double y);
    // Assigns range values by index.
    void set_item(const nc::Slice& indexes, double y);
    void set_item(const nc::Slice& indexes, const nc::NdArray<double>& y);

    Signal& fill_nan(FillNanMethod method = FillNanMethod::Interpolation, double default_value = 0.0);

    // Fractional position of x between its bracketing samples. Outside the
    // domain, the distance to the nearest boundary sample.
    double domain_distance(double x) const;
    nc::NdArray<double> domain_distance(const nc::NdArray<double>& x) const;

    bool is_uniform() const;

    // True when x lies within the domain envelope.
    bool contains(double x) const;
    bool contains(const nc::NdArray<double>& x) const;

    /**
     * @brief Applies an arithmetic operator to the range.
     *
     * With a Signal operand the operator is applied at this signal's domain
     * values and the samples in only one of the two domains become NaN.
     * @return The resulting signal; this signal is also updated when in_place.
     */
    Signal apply_arithmetic(double operand, ArithmeticOperator op, bool in_place = false);
    Signal apply_arithmetic(const nc::NdArray<double>& operand, ArithmeticOperator op, bool in_place = false);
    Signal apply_arithmetic(const Signal& operand, ArithmeticOperator op, bool in_place = false);

    friend bool operator==(const Signal& a, const Signal& b);
    friend bool operator!=(const Signal& a, const Signal& b) { return !(a == b); }
    friend std::ostream& operator<<(std::ostream& os, const Signal& signal);

private:
    static std::shared_ptr<const algebra::Extrapolator> build_function(
        const std::vector<double>& domain,
        const std::vector<double>& range,
        const algebra::InterpolatorSettings& interpolator_settings,
        const algebra::ExtrapolatorSettings& extrapolator_settings);
    static void insert_sample(std::vector<double>& domain, std::vector<double>& range, double x, double y);

    void validate_domain(const std::vector<double>& domain) const;
    void require_assignable(const nc::NdArray<double>& x) const;
    void commit(std::vector<double> domain, std::vector<double> range);
    void rebuild();
    double evaluate_single(double x) const;
    void arithmetic_in_place(const std::vector<double>& operand, ArithmeticOperator op);

    std::string m_name;
    std::vector<double> m_domain;
    std::vector<double> m_range;
    algebra::InterpolatorSettings m_interpolator_settings;
    algebra::ExtrapolatorSettings m_extrapolator_settings;
    std::shared_ptr<const algebra::Extrapolator> m_function;
};

} // namespace continuous
} // namespace chromat
