/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common_objects/amount.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/algorithm/string/classification.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include "utils/string_builder.hpp"

using teller::model::Amount;
using teller::model::types::PrecisionType;

namespace {
  const char kDecimalSeparator = '.';
  const char kZero = '0';
  const std::string kNaN = "NaN";

  using Repr = boost::multiprecision::checked_uint256_t;

  Repr powerOfTen(unsigned exponent) {
    return boost::multiprecision::pow(Repr(10), exponent);
  }
}  // namespace

struct Amount::Impl {
  Impl() : valid(false), precision(0), value(0), string_repr(kNaN) {}

  Impl(Repr repr, PrecisionType digits_after_dot)
      : valid(true), precision(digits_after_dot), value(std::move(repr)) {
    render();
  }

  /// Builds the canonical text from value and precision.
  void render() {
    auto digits = value.str();
    if (digits.size() <= precision) {
      digits.insert(0, precision - digits.size() + 1, kZero);
    }
    if (precision > 0) {
      digits.insert(digits.size() - precision, 1, kDecimalSeparator);
    }
    string_repr = std::move(digits);
  }

  static std::unique_ptr<Impl> parse(std::string_view amount) {
    if (amount.empty()) {
      return std::make_unique<Impl>();
    }

    static const auto is_digit = boost::is_digit();
    auto dot_pos = std::string_view::npos;
    for (size_t i = 0; i < amount.size(); ++i) {
      if (amount[i] == kDecimalSeparator and dot_pos == std::string_view::npos) {
        dot_pos = i;
      } else if (not is_digit(amount[i])) {
        return std::make_unique<Impl>();
      }
    }

    // both the integer and the fractional part need at least one digit
    if (dot_pos == 0 or dot_pos + 1 == amount.size()) {
      return std::make_unique<Impl>();
    }

    std::string digits;
    size_t precision = 0;
    if (dot_pos == std::string_view::npos) {
      digits.assign(amount);
    } else {
      precision = amount.size() - dot_pos - 1;
      digits.assign(amount.substr(0, dot_pos));
      digits.append(amount.substr(dot_pos + 1));
    }
    if (precision > std::numeric_limits<PrecisionType>::max()) {
      return std::make_unique<Impl>();
    }

    try {
      return std::make_unique<Impl>(Repr(digits),
                                    static_cast<PrecisionType>(precision));
    } catch (std::overflow_error const &) {
      return std::make_unique<Impl>();
    }
  }

  /// @return value expressed with the given greater or equal precision
  Repr scaledTo(PrecisionType target) const {
    return value * powerOfTen(target - precision);
  }

  bool valid;
  PrecisionType precision;
  Repr value;
  std::string string_repr;
};

Amount::Amount(std::string_view amount) : impl_(Impl::parse(amount)) {}

Amount::Amount(PrecisionType precision)
    : impl_(std::make_unique<Impl>(Repr(0), precision)) {}

Amount::Amount(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Amount::Amount(Amount const &other)
    : impl_(std::make_unique<Impl>(*other.impl_)) {}

Amount::Amount(Amount &&other) noexcept
    : impl_(std::exchange(other.impl_, nullptr)) {}

Amount &Amount::operator=(Amount const &other) {
  return *this = Amount(other);
}

Amount &Amount::operator=(Amount &&other) noexcept {
  std::swap(impl_, other.impl_);
  return *this;
}

Amount::~Amount() = default;

bool Amount::isValid() const {
  return impl_->valid;
}

int Amount::sign() const {
  return impl_->valid ? impl_->value.sign() : 0;
}

PrecisionType Amount::precision() const {
  return impl_->precision;
}

std::string const &Amount::toStringRepr() const {
  return impl_->string_repr;
}

Amount Amount::rescaled(PrecisionType precision) const {
  if (not impl_->valid) {
    return Amount(std::make_unique<Impl>());
  }
  try {
    if (precision >= impl_->precision) {
      return Amount(
          std::make_unique<Impl>(impl_->scaledTo(precision), precision));
    }
    auto divisor = powerOfTen(impl_->precision - precision);
    if (impl_->value % divisor != 0) {
      return Amount(std::make_unique<Impl>());
    }
    return Amount(std::make_unique<Impl>(impl_->value / divisor, precision));
  } catch (std::overflow_error const &) {
    return Amount(std::make_unique<Impl>());
  }
}

Amount &Amount::operator+=(Amount const &other) {
  if (not impl_->valid or not other.impl_->valid) {
    impl_ = std::make_unique<Impl>();
    return *this;
  }
  auto precision = std::max(impl_->precision, other.impl_->precision);
  try {
    impl_ = std::make_unique<Impl>(
        impl_->scaledTo(precision) + other.impl_->scaledTo(precision),
        precision);
  } catch (std::overflow_error const &) {
    impl_ = std::make_unique<Impl>();
  }
  return *this;
}

Amount &Amount::operator-=(Amount const &other) {
  if (not impl_->valid or not other.impl_->valid) {
    impl_ = std::make_unique<Impl>();
    return *this;
  }
  auto precision = std::max(impl_->precision, other.impl_->precision);
  try {
    impl_ = std::make_unique<Impl>(
        impl_->scaledTo(precision) - other.impl_->scaledTo(precision),
        precision);
  } catch (std::range_error const &) {
    impl_ = std::make_unique<Impl>();
  } catch (std::overflow_error const &) {
    impl_ = std::make_unique<Impl>();
  }
  return *this;
}

bool Amount::operator==(Amount const &rhs) const {
  if (not impl_->valid or not rhs.impl_->valid) {
    return false;
  }
  auto precision = std::max(impl_->precision, rhs.impl_->precision);
  try {
    return impl_->scaledTo(precision) == rhs.impl_->scaledTo(precision);
  } catch (std::overflow_error const &) {
    return false;
  }
}

bool Amount::operator!=(Amount const &rhs) const {
  return not(*this == rhs);
}

bool Amount::operator<(Amount const &rhs) const {
  if (not impl_->valid or not rhs.impl_->valid) {
    return false;
  }
  auto precision = std::max(impl_->precision, rhs.impl_->precision);
  try {
    return impl_->scaledTo(precision) < rhs.impl_->scaledTo(precision);
  } catch (std::overflow_error const &) {
    // the side that overflowed while scaling is the greater one
    return impl_->precision > rhs.impl_->precision;
  }
}

std::string Amount::toString() const {
  return detail::PrettyStringBuilder()
      .init("Amount")
      .append(impl_->string_repr)
      .finalize();
}
