#include <algorithm>
#include <chainwatch/common/amount.hpp>
#include <cmath>

namespace chainwatch {

    Result<Amount, Error> Amount::parse(const std::string &text) {
        if (text.empty()) {
            return Result<Amount, Error>::err(invalid_amount("Empty amount"));
        }
        for (char c : text) {
            if (c < '0' || c > '9') {
                return Result<Amount, Error>::err(invalid_amount("Amount is not a base-10 integer: " + text));
            }
        }
        auto first = text.find_first_not_of('0');
        if (first == std::string::npos) {
            return Result<Amount, Error>::ok(Amount());
        }
        return Result<Amount, Error>::ok(Amount(text.substr(first)));
    }

    double Amount::toHuman(int decimals) const {
        // Long digit strings lose precision here; rules only need magnitude
        double value = 0.0;
        for (char c : digits_) {
            value = value * 10.0 + static_cast<double>(c - '0');
        }
        if (decimals > 0) {
            value /= std::pow(10.0, decimals);
        }
        return value;
    }

    Amount Amount::operator+(const Amount &other) const {
        const std::string &a = digits_;
        const std::string &b = other.digits_;

        std::string sum;
        sum.reserve(std::max(a.size(), b.size()) + 1);

        int carry = 0;
        auto ia = a.rbegin();
        auto ib = b.rbegin();
        while (ia != a.rend() || ib != b.rend() || carry) {
            int digit = carry;
            if (ia != a.rend())
                digit += *ia++ - '0';
            if (ib != b.rend())
                digit += *ib++ - '0';
            sum.push_back(static_cast<char>('0' + digit % 10));
            carry = digit / 10;
        }
        std::reverse(sum.begin(), sum.end());
        return Amount(std::move(sum));
    }

    Amount &Amount::operator+=(const Amount &other) {
        *this = *this + other;
        return *this;
    }

    int Amount::compare(const Amount &other) const {
        if (digits_.size() != other.digits_.size()) {
            return digits_.size() < other.digits_.size() ? -1 : 1;
        }
        int c = digits_.compare(other.digits_);
        return (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }

} // namespace chainwatch
