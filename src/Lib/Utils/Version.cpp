#include <Plm/Utils/Version.hpp>

#include <algorithm> // std::ranges::all_of
#include <cctype>    // std::isalnum, std::isdigit

namespace plm::utils::version {
  using types::StringView;
  using types::usize;

  namespace {
    fn IsNumericPart(const StringView part) -> bool {
      if (part.empty())
        return false;

      if (!std::ranges::all_of(part, [](const unsigned char chr) { return std::isdigit(chr) != 0; }))
        return false;

      return part.size() == 1 || part.front() != '0';
    }

    // Numeric identifiers must not have leading zeros when numericStrict is set (pre-release only).
    fn IsIdentifierList(const StringView list, const bool numericStrict) -> bool {
      if (list.empty())
        return false;

      usize start = 0;

      while (start <= list.size()) {
        const usize      end   = std::min(list.find('.', start), list.size());
        const StringView ident = list.substr(start, end - start);

        if (ident.empty())
          return false;

        if (!std::ranges::all_of(ident, [](const unsigned char chr) { return std::isalnum(chr) != 0 || chr == '-'; }))
          return false;

        if (numericStrict && std::ranges::all_of(ident, [](const unsigned char chr) { return std::isdigit(chr) != 0; }) && !IsNumericPart(ident))
          return false;

        start = end + 1;
      }

      return true;
    }
  } // namespace

  fn IsValidSemver(const StringView version) -> bool {
    StringView core = version;

    if (const usize plus = core.find('+'); plus != StringView::npos) {
      if (!IsIdentifierList(core.substr(plus + 1), false))
        return false;

      core = core.substr(0, plus);
    }

    if (const usize dash = core.find('-'); dash != StringView::npos) {
      if (!IsIdentifierList(core.substr(dash + 1), true))
        return false;

      core = core.substr(0, dash);
    }

    const usize firstDot = core.find('.');
    if (firstDot == StringView::npos)
      return false;

    const usize secondDot = core.find('.', firstDot + 1);
    if (secondDot == StringView::npos || core.find('.', secondDot + 1) != StringView::npos)
      return false;

    return IsNumericPart(core.substr(0, firstDot)) &&
      IsNumericPart(core.substr(firstDot + 1, secondDot - firstDot - 1)) &&
      IsNumericPart(core.substr(secondDot + 1));
  }
} // namespace plm::utils::version
