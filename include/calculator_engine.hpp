#pragma once

#include "button_layout.hpp"
#include <optional>
#include <string>

namespace calculator {

// Longest operand that can be typed (sign and decimal point included)
constexpr size_t kMaxOperandLength = 12;

// Display text of the error state
extern const char* const kErrorText;

// Format a result the way the display shows it:
//  - "%.2e" for |r| > 999999999 or 0 < |r| < 0.000001
//  - plain integer when integral
//  - otherwise up to 8 decimals, trailing zeros stripped
// Non-finite values give kErrorText.
std::string format_number(double value);

// Parse a display operand ("12.5", "-3", "0.", "1.00e+10"); nullopt when malformed
std::optional<double> parse_operand(const std::string& text);

// Apply a binary operator. nullopt for division by zero, a non-operator id
// or a non-finite result.
std::optional<double> evaluate(double lhs, layout::ButtonId op, double rhs);

// One completed "a op b = result" calculation
struct Calculation {
    std::string lhs;
    std::string op;
    std::string rhs;
    std::string result;

    std::string to_string() const { return lhs + " " + op + " " + rhs + " = " + result; }
};

// Left-to-right expression accumulator driven by button presses.
class CalculatorEngine {
public:
    CalculatorEngine();

    // Apply one press and return the new display text
    const std::string& apply(layout::ButtonId id);

    const std::string& display() const { return display_; }
    void reset();

    bool is_error() const { return error_; }
    const std::string& operand() const { return operand_; }
    const std::string& left_operand() const { return left_; }
    std::optional<layout::ButtonId> pending_operator() const { return op_; }
    bool just_calculated() const { return just_calculated_; }

    // Calculation completed by the last `=`, cleared once taken
    std::optional<Calculation> take_calculation();

private:
    void press_digit(int digit);
    void press_decimal();
    void press_operator(layout::ButtonId op);
    void press_equals();
    void press_delete();
    void press_toggle_sign();
    void press_percent();

    void enter_error();
    void show_operand();

    std::string display_;
    std::string operand_;  // Operand being typed (or the last result)
    std::string left_;     // Left operand of the pending operation
    std::optional<layout::ButtonId> op_;
    bool just_calculated_;
    bool error_;
    std::optional<Calculation> completed_;
};

} // namespace calculator
