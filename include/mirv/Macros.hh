#ifndef MIRV_MACROS_HH
#define MIRV_MACROS_HH

#include <libassert/assert.hpp>
#include <base/Macros.hh>
#include <base/Assert.hh>

#define MIRV_CAT(X, Y)  LIBBASE_CAT_(X, Y)
#define MIRV_IMMOVABLE(X) LIBBASE_IMMOVABLE(X)

/// Propagate the error of an 'EvalResult' to the caller, or yield
/// its value if there is one.
#define MIRV_TRY(...) ({                                                    \
    auto&& MIRV_CAT(_mirv_res_, __LINE__) = (__VA_ARGS__);                  \
    if (not MIRV_CAT(_mirv_res_, __LINE__))                                 \
        return std::unexpected(std::move(MIRV_CAT(_mirv_res_, __LINE__)).error()); \
    std::move(MIRV_CAT(_mirv_res_, __LINE__)).value();                      \
})

// Here until compilers support delete("message").
// clang-format off
#if __cpp_deleted_function >= 202403L
#    define MIRV_DELETED(Msg) delete (Msg)
#else
#    define MIRV_DELETED(Msg) delete
#endif
// clang-format on

#endif // MIRV_MACROS_HH
