
#ifndef CALCFLOW_OUTCOME_HPP
#define CALCFLOW_OUTCOME_HPP

#include <string>
#include <system_error>
#include <type_traits>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>

namespace outcome {
  template <class R, class S = std::error_code>
  using result = BOOST_OUTCOME_V2_NAMESPACE::std_result<R, S>;

  using BOOST_OUTCOME_V2_NAMESPACE::success;
  using BOOST_OUTCOME_V2_NAMESPACE::failure;
}  // namespace outcome

/**
 * Registers a scoped enum as a std::error_code enum.
 * Must be used at global scope in the header that declares the enum.
 */
#define CALCFLOW_DECLARE_ERROR(Namespace, Enum)                \
  namespace Namespace {                                        \
    const std::error_category &Enum##_category() noexcept;     \
    std::error_code make_error_code(Enum e) noexcept;          \
    std::string Enum##_message(Enum e);                        \
  }                                                            \
  namespace std {                                              \
    template <>                                                \
    struct is_error_code_enum<Namespace::Enum> : true_type {}; \
  }

/**
 * Defines the category of an enum registered with CALCFLOW_DECLARE_ERROR.
 * The macro is followed by the body of a function mapping @a var to a
 * message, e.g. CALCFLOW_DEFINE_ERROR_CATEGORY(ns, E, e) { switch (e) ... }
 */
#define CALCFLOW_DEFINE_ERROR_CATEGORY(Namespace, Enum, var)          \
  namespace Namespace {                                               \
    class Enum##Category final : public std::error_category {        \
     public:                                                          \
      const char *name() const noexcept override {                    \
        return #Enum;                                                 \
      }                                                               \
      std::string message(int value) const override {                 \
        return Enum##_message(static_cast<Enum>(value));              \
      }                                                               \
    };                                                                \
    const std::error_category &Enum##_category() noexcept {           \
      static const Enum##Category category{};                         \
      return category;                                                \
    }                                                                 \
    std::error_code make_error_code(Enum e) noexcept {                \
      return {static_cast<int>(e), Enum##_category()};                \
    }                                                                 \
  }                                                                   \
  std::string Namespace::Enum##_message(Namespace::Enum var)

#endif  // CALCFLOW_OUTCOME_HPP
