#include "csv2json/errc.hpp"

namespace c2j {

std::string_view errc_name(Errc e) noexcept {
  switch (e) {
    case Errc::Ok:               return "Ok";
    case Errc::QuoteInTheMiddle: return "QuoteInTheMiddle";
    case Errc::QuoteUnbalanced:  return "QuoteUnbalanced";
    case Errc::AppendFailed:     return "AppendFailed";
    case Errc::LineTooLong:      return "LineTooLong";
    case Errc::ReadFailed:       return "ReadFailed";
    case Errc::WriteFailed:      return "WriteFailed";
  }
  return "Unknown";
}

}
