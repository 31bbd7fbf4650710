#include "calculator_engine.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace calculator {

const char* const kErrorText = "Error";

std::string format_number(double value) {
    if (!std::isfinite(value)) return kErrorText;
    if (value == 0.0) value = 0.0;  // drop the sign of -0

    char buf[64];
    double mag = std::fabs(value);
    if (mag > 999999999.0 || (mag < 0.000001 && value != 0.0)) {
        std::snprintf(buf, sizeof(buf), "%.2e", value);
        return buf;
    }
    if (value == std::floor(value)) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.8f", value);
    std::string s(buf);
    size_t last = s.find_last_not_of('0');
    if (last != std::string::npos) s.erase(last + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::optional<double> parse_operand(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<double> evaluate(double lhs, layout::ButtonId op, double rhs) {
    double result = 0.0;
    switch (op) {
        case layout::ButtonId::ADD: result = lhs + rhs; break;
        case layout::ButtonId::SUBTRACT: result = lhs - rhs; break;
        case layout::ButtonId::MULTIPLY: result = lhs * rhs; break;
        case layout::ButtonId::DIVIDE:
            if (rhs == 0.0) return std::nullopt;
            result = lhs / rhs;
            break;
        default:
            return std::nullopt;
    }
    if (!std::isfinite(result)) return std::nullopt;
    return result;
}

CalculatorEngine::CalculatorEngine() : display_("0"), just_calculated_(false), error_(false) {}

void CalculatorEngine::reset() {
    display_ = "0";
    operand_.clear();
    left_.clear();
    op_.reset();
    just_calculated_ = false;
    error_ = false;
}

std::optional<Calculation> CalculatorEngine::take_calculation() {
    std::optional<Calculation> out = std::move(completed_);
    completed_.reset();
    return out;
}

const std::string& CalculatorEngine::apply(layout::ButtonId id) {
    using layout::ButtonId;
    if (layout::is_digit(id)) {
        press_digit(layout::digit_value(id));
        return display_;
    }
    switch (id) {
        case ButtonId::DECIMAL: press_decimal(); break;
        case ButtonId::ADD:
        case ButtonId::SUBTRACT:
        case ButtonId::MULTIPLY:
        case ButtonId::DIVIDE: press_operator(id); break;
        case ButtonId::EQUALS: press_equals(); break;
        case ButtonId::CLEAR: reset(); break;
        case ButtonId::DEL: press_delete(); break;
        case ButtonId::TOGGLE_SIGN: press_toggle_sign(); break;
        case ButtonId::PERCENT: press_percent(); break;
        default: break;
    }
    return display_;
}

void CalculatorEngine::show_operand() {
    display_ = operand_.empty() ? "0" : operand_;
}

void CalculatorEngine::enter_error() {
    operand_.clear();
    left_.clear();
    op_.reset();
    just_calculated_ = false;
    error_ = true;
    display_ = kErrorText;
}

void CalculatorEngine::press_digit(int digit) {
    char c = static_cast<char>('0' + digit);
    if (error_) {
        reset();
    }
    if (just_calculated_) {
        operand_.clear();
        just_calculated_ = false;
    }
    if (operand_ == "0") {
        operand_ = c;
    } else if (operand_ == "-0") {
        operand_ = std::string("-") + c;
    } else if (operand_.size() < kMaxOperandLength) {
        operand_ += c;
    }
    show_operand();
}

void CalculatorEngine::press_decimal() {
    if (error_) {
        reset();
    }
    if (just_calculated_) {
        operand_.clear();
        just_calculated_ = false;
    }
    if (operand_.find('.') != std::string::npos) return;
    if (operand_.empty()) {
        operand_ = "0.";
    } else if (operand_ == "-") {
        operand_ = "-0.";
    } else if (operand_.size() < kMaxOperandLength) {
        operand_ += '.';
    }
    show_operand();
}

void CalculatorEngine::press_operator(layout::ButtonId op) {
    if (error_) return;
    just_calculated_ = false;

    if (operand_.empty()) {
        // Nothing typed since the last operator: replace it
        if (left_.empty()) left_ = "0";
        op_ = op;
        display_ = left_;
        return;
    }

    if (op_ && !left_.empty()) {
        auto lhs = parse_operand(left_);
        auto rhs = parse_operand(operand_);
        std::optional<double> result;
        if (lhs && rhs) result = evaluate(*lhs, *op_, *rhs);
        if (!result) {
            std::cerr << "[Calculator][WARN] " << left_ << " " << layout::button_label(*op_) << " " << operand_
                      << " cannot be evaluated\n";
            enter_error();
            return;
        }
        left_ = format_number(*result);
    } else {
        auto lhs = parse_operand(operand_);
        if (!lhs) {
            enter_error();
            return;
        }
        left_ = operand_;
    }
    op_ = op;
    operand_.clear();
    display_ = left_;
}

void CalculatorEngine::press_equals() {
    if (error_) return;
    if (!op_ || left_.empty() || operand_.empty()) return;

    auto lhs = parse_operand(left_);
    auto rhs = parse_operand(operand_);
    std::optional<double> result;
    if (lhs && rhs) result = evaluate(*lhs, *op_, *rhs);

    Calculation calc{left_, layout::button_label(*op_), operand_, result ? format_number(*result) : kErrorText};
    completed_ = calc;

    if (!result) {
        std::cerr << "[Calculator][WARN] " << calc.to_string() << "\n";
        enter_error();
        return;
    }
    operand_ = calc.result;
    left_.clear();
    op_.reset();
    just_calculated_ = true;
    display_ = operand_;
}

void CalculatorEngine::press_delete() {
    if (error_) {
        reset();
        return;
    }
    if (just_calculated_) {
        // A computed result is not edited; a single character clears to 0
        if (operand_.size() <= 1) {
            operand_.clear();
            just_calculated_ = false;
            show_operand();
        }
        return;
    }
    if (!operand_.empty()) {
        operand_.pop_back();
        if (operand_ == "-") operand_.clear();
    }
    show_operand();
}

void CalculatorEngine::press_toggle_sign() {
    if (error_) return;
    if (operand_.empty() || operand_ == "0") return;
    if (operand_[0] == '-') {
        operand_.erase(0, 1);
    } else {
        operand_.insert(0, 1, '-');
    }
    show_operand();
}

void CalculatorEngine::press_percent() {
    if (error_) return;
    if (operand_.empty()) return;
    auto value = parse_operand(operand_);
    if (!value) {
        enter_error();
        return;
    }
    operand_ = format_number(*value / 100.0);
    show_operand();
}

} // namespace calculator
