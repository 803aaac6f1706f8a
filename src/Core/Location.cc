#include <mirv/Core/Location.hh>

using namespace mirv;

auto Location::format() const -> std::string {
    if (not is_valid()) return "<unknown>";
    return std::format("{} bb{}[{}]", proc, block, stmt);
}
