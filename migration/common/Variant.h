#pragma once

#include <folly/lang/Assume.h>
#include <new>
#include <utility>

/**
 * Declares a tagged union over a list of types given as an X-macro. The
 * generated struct exposes type(), asX() accessors returning nullptr when
 * the active member is not X, value semantics and equality.
 */

#define UNION_TYPE(X, ...) X X##_;

#define ENUM_TYPES(X, ...) X,

#define UNION_ACCESSOR(X, ...) \
  X* as##X() {                 \
    if (type_ == Type::X) {    \
      return &X##_;            \
    }                          \
    return nullptr;            \
  }                            \
                               \
  const X* as##X() const {     \
    if (type_ == Type::X) {    \
      return &X##_;            \
    }                          \
    return nullptr;            \
  }

#define UNION_CTORS(X, NAME)        \
  NAME(X&& x) : type_(Type::X) {    \
    new (&X##_) X(std::move(x));    \
  }

#define UNION_COPY_CTORS(X, NAME)     \
  NAME(const X& x) : type_(Type::X) { \
    new (&X##_) X(x);                 \
  }

#define UNION_MOVE_CASES(X, other)         \
  case Type::X:                            \
    new (&X##_) X(std::move(other.X##_));  \
    break;

#define UNION_COPY_CASES(X, other) \
  case Type::X:                    \
    new (&X##_) X(other.X##_);     \
    break;

#define UNION_DESTRUCTOR_CASES(X, ...) \
  case Type::X:                        \
    X##_.~X();                         \
    break;

#define UNION_EQUALITY_CASES(X, other) \
  case Type::X:                        \
    return X##_ == other.X##_;

#define DECLARE_VARIANT_TYPE(NAME, X)                \
  struct NAME {                                      \
    enum class Type { X(ENUM_TYPES) };               \
                                                     \
    X(UNION_CTORS, NAME)                             \
                                                     \
    X(UNION_COPY_CTORS, NAME)                        \
                                                     \
    NAME(NAME&& other) {                             \
      switch (other.type_) { X(UNION_MOVE_CASES, other) } \
      type_ = other.type_;                           \
    }                                                \
                                                     \
    NAME(const NAME& other) {                        \
      switch (other.type_) { X(UNION_COPY_CASES, other) } \
      type_ = other.type_;                           \
    }                                                \
                                                     \
    NAME& operator=(NAME&& other) {                  \
      if (this != &other) {                          \
        destroyVariant();                            \
        switch (other.type_) { X(UNION_MOVE_CASES, other) } \
        type_ = other.type_;                         \
      }                                              \
      return *this;                                  \
    }                                                \
                                                     \
    NAME& operator=(const NAME& other) {             \
      if (this != &other) {                          \
        destroyVariant();                            \
        switch (other.type_) { X(UNION_COPY_CASES, other) } \
        type_ = other.type_;                         \
      }                                              \
      return *this;                                  \
    }                                                \
                                                     \
    ~NAME() {                                        \
      destroyVariant();                              \
    }                                                \
                                                     \
    bool operator==(const NAME& other) const {       \
      if (type_ != other.type_) {                    \
        return false;                                \
      }                                              \
      switch (type_) { X(UNION_EQUALITY_CASES, other) } \
      folly::assume_unreachable();                   \
    }                                                \
                                                     \
    bool operator!=(const NAME& other) const {       \
      return !(*this == other);                      \
    }                                                \
                                                     \
    Type type() const {                              \
      return type_;                                  \
    }                                                \
                                                     \
    X(UNION_ACCESSOR)                                \
                                                     \
   private:                                          \
    void destroyVariant() {                          \
      switch (type_) { X(UNION_DESTRUCTOR_CASES) }   \
    }                                                \
                                                     \
    union {                                          \
      X(UNION_TYPE)                                  \
    };                                               \
    Type type_;                                      \
  };
