#ifndef MIRV_CORE_UTILS_HH
#define MIRV_CORE_UTILS_HH

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/FoldingSet.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/raw_ostream.h>

#include <base/Base.hh>
#include <base/Colours.hh>
#include <base/Text.hh>
#include <base/Size.hh>

#include <expected>
#include <print>
#include <string>

static_assert(
    CHAR_BIT == 8,
    "Hosts where a byte is not 8 bits are not and will not be supported"
);

namespace mirv {
using namespace base;

using llvm::cast;
using llvm::dyn_cast;
using llvm::isa;

using llvm::APInt;
using llvm::ArrayRef;
using llvm::DenseMap;
using llvm::FoldingSet;
using llvm::FoldingSetNode;
using llvm::FoldingSetNodeID;
using llvm::SmallString;
using llvm::SmallVector;
using llvm::StringMap;
using llvm::StringRef;

// String that contains formatting characters that are yet to be rendered.
using SmallUnrenderedString = SmallString<128>;
} // namespace mirv

template <>
struct std::formatter<llvm::APInt> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const llvm::APInt& i, FormatContext& ctx) const {
        return formatter<std::string>::format(llvm::toString(i, 10, true), ctx);
    }
};

template <>
struct std::formatter<llvm::StringRef> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(llvm::StringRef s, FormatContext& ctx) const {
        return formatter<std::string_view>::format(std::string_view{s.data(), s.size()}, ctx);
    }
};

template <mirv::usz n>
struct std::formatter<llvm::SmallString<n>> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const llvm::SmallString<n>& s, FormatContext& ctx) const {
        return formatter<std::string_view>::format(std::string_view{s.data(), s.size()}, ctx);
    }
};

#endif // MIRV_CORE_UTILS_HH
