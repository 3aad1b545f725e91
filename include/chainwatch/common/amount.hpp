#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include "error.hpp"

namespace chainwatch {

    using namespace datapod;

    /// Unsigned integer token amount of arbitrary size, kept as canonical decimal digits
    class Amount {
      public:
        Amount() : digits_("0") {}

        /// Parse a base-10 unsigned integer; leading zeros are dropped
        static Result<Amount, Error> parse(const std::string &text);

        const std::string &toString() const { return digits_; }

        bool isZero() const { return digits_ == "0"; }

        /// Scale down by 10^decimals into a human-readable value
        double toHuman(int decimals) const;

        Amount operator+(const Amount &other) const;
        Amount &operator+=(const Amount &other);

        /// -1, 0 or 1
        int compare(const Amount &other) const;

        bool operator==(const Amount &other) const { return digits_ == other.digits_; }
        bool operator!=(const Amount &other) const { return digits_ != other.digits_; }
        bool operator<(const Amount &other) const { return compare(other) < 0; }

      private:
        explicit Amount(std::string digits) : digits_(std::move(digits)) {}

        std::string digits_;
    };

} // namespace chainwatch
