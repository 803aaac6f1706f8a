#ifndef MIRV_CORE_LOCATION_HH
#define MIRV_CORE_LOCATION_HH

#include <mirv/Core/Utils.hh>

namespace mirv {
struct Location;
}

/// A position in the IR.
///
/// Locations name a statement by its procedure, block, and index in
/// the block; an index equal to the number of statements in the block
/// refers to the block’s terminator.
struct mirv::Location {
    /// Name of the procedure. Names are owned by the module.
    StringRef proc;

    /// Index of the basic block.
    u32 block = 0;

    /// Index of the statement in the block.
    u32 stmt = 0;

    constexpr Location() = default;
    constexpr Location(StringRef proc, u32 block, u32 stmt)
        : proc{proc}, block{block}, stmt{stmt} {}

    /// Format this location, e.g. 'main bb2[3]'.
    [[nodiscard]] auto format() const -> std::string;

    /// Check if this is a valid location.
    [[nodiscard]] bool is_valid() const { return not proc.empty(); }

    [[nodiscard]] friend bool operator==(const Location& a, const Location& b) {
        return a.proc == b.proc and a.block == b.block and a.stmt == b.stmt;
    }
};

#endif // MIRV_CORE_LOCATION_HH
