// Local "syntax enhancements", included right after opening a namespace and undone by "macros_close.hpp".
// Requires "common.hpp" for the functions behind `unreachable`, `unimplemented` and `assert`.

// Marks a pure virtual member function.
#define required = 0

// Used for declaring a class as "interface" (non-instantiable, copyable by derived classes, virtual destructor).
// See: https://softwareengineering.stackexchange.com/questions/235674/what-is-the-pattern-for-a-safe-interface-in-c
#define interface(T)                                 \
protected:                                           \
  T() noexcept = default;                            \
  T(T const&) noexcept = default;                    \
  T(T&&) noexcept = default;                         \
  auto operator=(T const&) noexcept -> T& = default; \
  auto operator=(T&&) noexcept -> T& = default;      \
                                                     \
public:                                              \
  virtual ~T() = default

#define unreachable   unreachable(__FILE__, __LINE__, static_cast<char const*>(__func__))
#define unimplemented unimplemented(__FILE__, __LINE__, static_cast<char const*>(__func__))
#define assert(expr)  assert(!!(expr), #expr, __FILE__, __LINE__, static_cast<char const*>(__func__))
