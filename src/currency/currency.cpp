#include "currency/currency.h"

#include <algorithm>
#include <iomanip>
#include <stdexcept>

namespace {

// Active ISO-4217 alphabetic codes, kept sorted for binary search
const std::vector<std::string> iso_4217_codes = {
  "AED", "AFN", "ALL", "AMD", "ANG", "AOA", "ARS", "AUD", "AWG", "AZN",
  "BAM", "BBD", "BDT", "BGN", "BHD", "BIF", "BMD", "BND", "BOB", "BOV",
  "BRL", "BSD", "BTN", "BWP", "BYN", "BZD", "CAD", "CDF", "CHE", "CHF",
  "CHW", "CLF", "CLP", "CNY", "COP", "COU", "CRC", "CUC", "CUP", "CVE",
  "CZK", "DJF", "DKK", "DOP", "DZD", "EGP", "ERN", "ETB", "EUR", "FJD",
  "FKP", "GBP", "GEL", "GHS", "GIP", "GMD", "GNF", "GTQ", "GYD", "HKD",
  "HNL", "HTG", "HUF", "IDR", "ILS", "INR", "IQD", "IRR", "ISK", "JMD",
  "JOD", "JPY", "KES", "KGS", "KHR", "KMF", "KPW", "KRW", "KWD", "KYD",
  "KZT", "LAK", "LBP", "LKR", "LRD", "LSL", "LYD", "MAD", "MDL", "MGA",
  "MKD", "MMK", "MNT", "MOP", "MRU", "MUR", "MVR", "MWK", "MXN", "MXV",
  "MYR", "MZN", "NAD", "NGN", "NIO", "NOK", "NPR", "NZD", "OMR", "PAB",
  "PEN", "PGK", "PHP", "PKR", "PLN", "PYG", "QAR", "RON", "RSD", "RUB",
  "RWF", "SAR", "SBD", "SCR", "SDG", "SEK", "SGD", "SHP", "SLE", "SLL",
  "SOS", "SRD", "SSP", "STN", "SVC", "SYP", "SZL", "THB", "TJS", "TMT",
  "TND", "TOP", "TRY", "TTD", "TWD", "TZS", "UAH", "UGX", "USD", "USN",
  "UYI", "UYU", "UYW", "UZS", "VED", "VES", "VND", "VUV", "WST", "XAF",
  "XAG", "XAU", "XBA", "XBB", "XBC", "XBD", "XCD", "XDR", "XOF", "XPD",
  "XPF", "XPT", "XSU", "XTS", "XUA", "XXX", "YER", "ZAR", "ZMW", "ZWL"
};

} // namespace

Currency::Currency(const std::string &code, double amount) : code{code}, amount{amount} {
  if (!is_valid_code(code)) {
    throw std::invalid_argument("'" + code + "' is not a valid ISO-4217 code");
  }
}

bool Currency::is_valid_code(const std::string &code) {
  return std::binary_search(iso_4217_codes.begin(), iso_4217_codes.end(), code);
}

const std::vector<std::string> &Currency::registry() {
  return iso_4217_codes;
}

std::ostream &operator<<(std::ostream &out, const Currency &currency) {
  std::ios_base::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();
  out << currency.get_code() << " " << std::fixed << std::setprecision(2) << currency.get_amount();
  out.flags(flags);
  out.precision(precision);
  return out;
}
