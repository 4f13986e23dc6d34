// File: calculator/results.hpp

#ifndef CALCULATOR_RESULTS_HPP
#define CALCULATOR_RESULTS_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include "atoms/structure.hpp"

namespace calculator {

    using PropertyValue = std::variant<double, atoms::Structure::Forces>;

    // Properties of the last calculation, keyed by name ("energy", "forces", "uncertainty").
    class Results {
    public:
        void set(const std::string &name, PropertyValue value) { values_[name] = std::move(value); }
        void clear() noexcept { values_.clear(); }

        [[nodiscard]] bool contains(const std::string &name) const { return values_.contains(name); }
        [[nodiscard]] bool empty() const noexcept { return values_.empty(); }
        [[nodiscard]] const PropertyValue &at(const std::string &name) const {
            const auto it = values_.find(name);
            if (it == values_.end()) {
                throw std::out_of_range("Property '" + name + "' has not been calculated.");
            }
            return it->second;
        }

        [[nodiscard]] double energy() const { return std::get<double>(at("energy")); }
        [[nodiscard]] const atoms::Structure::Forces &forces() const {
            return std::get<atoms::Structure::Forces>(at("forces"));
        }
        // Unset when uncertainties were disabled or not requested.
        [[nodiscard]] std::optional<double> uncertainty() const {
            return contains("uncertainty") ? std::optional<double>(std::get<double>(at("uncertainty"))) : std::nullopt;
        }

    private:
        std::map<std::string, PropertyValue> values_;
    };

} // namespace calculator

#endif // CALCULATOR_RESULTS_HPP
