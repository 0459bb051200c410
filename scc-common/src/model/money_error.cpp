#include "scc/model/money_error.hpp"

#include <string>
#include <system_error>

namespace scc::model {

const std::error_category& money_category() noexcept {
  static struct : public std::error_category {
    const char* name() const noexcept override { return "scc.model.money"; }

    std::string message(int ev) const override {
      switch (static_cast<money_errc>(ev)) {
        case money_errc::invalid_currency_code:
          return "The currency code is not 3 letters long";
        case money_errc::sign_mismatch:
          return "The signs of the units and nanos do not match";
        case money_errc::nanos_out_of_range:
          return "The nanos field must be between -999,999,999 and "
                 "999,999,999";
        case money_errc::currency_mismatch:
          return "Money values need the same currency to be summed";
        case money_errc::positive_overflow:
          return "Addition failed due to positive overflow";
        case money_errc::negative_overflow:
          return "Addition failed due to negative overflow";
        default:
          return "Unknown money error";
      }
    }

    std::error_condition default_error_condition(
        int ev) const noexcept override {
      switch (static_cast<money_errc>(ev)) {
        case money_errc::invalid_currency_code:
        case money_errc::sign_mismatch:
        case money_errc::nanos_out_of_range:
        case money_errc::currency_mismatch:
          return std::errc::invalid_argument;
        case money_errc::positive_overflow:
        case money_errc::negative_overflow:
          return std::errc::value_too_large;
        default:
          return std::error_condition(ev, *this);
      }
    }
  } instance;

  return instance;
}

std::error_code make_error_code(money_errc ec) noexcept {
  return std::error_code(static_cast<int>(ec), money_category());
}

}  // namespace scc::model
