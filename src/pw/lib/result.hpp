// result.hpp - A Result<T,E> type for error handling
#ifndef PW_LIB_RESULT_HPP
#define PW_LIB_RESULT_HPP

#include <new>

// Success payload for operations that produce no value
struct Unit {};

// Stores either a success value of type T or an error value of type E.
// T and E live in a union so a Result never touches the heap.
template <typename T, typename E> class Result {
private:
  bool success_;
  union {
    T value_;
    E error_;
  };

  // Private default constructor for factory methods
  Result() {}

  void destroy() {
    if (success_) {
      value_.~T();
    } else {
      error_.~E();
    }
  }

public:
  Result(const Result &other) : success_(other.success_) {
    if (success_) {
      new (&value_) T(other.value_);
    } else {
      new (&error_) E(other.error_);
    }
  }

  Result(Result &&other) : success_(other.success_) {
    if (success_) {
      new (&value_) T(static_cast<T &&>(other.value_));
    } else {
      new (&error_) E(static_cast<E &&>(other.error_));
    }
  }

  ~Result() { destroy(); }

  Result &operator=(const Result &other) {
    if (this != &other) {
      destroy();
      success_ = other.success_;
      if (success_) {
        new (&value_) T(other.value_);
      } else {
        new (&error_) E(other.error_);
      }
    }
    return *this;
  }

  Result &operator=(Result &&other) {
    if (this != &other) {
      destroy();
      success_ = other.success_;
      if (success_) {
        new (&value_) T(static_cast<T &&>(other.value_));
      } else {
        new (&error_) E(static_cast<E &&>(other.error_));
      }
    }
    return *this;
  }

  static Result ok(const T &value) {
    Result r;
    r.success_ = true;
    new (&r.value_) T(value);
    return r;
  }

  static Result ok(T &&value) {
    Result r;
    r.success_ = true;
    new (&r.value_) T(static_cast<T &&>(value));
    return r;
  }

  static Result err(const E &error) {
    Result r;
    r.success_ = false;
    new (&r.error_) E(error);
    return r;
  }

  static Result err(E &&error) {
    Result r;
    r.success_ = false;
    new (&r.error_) E(static_cast<E &&>(error));
    return r;
  }

  bool is_ok() const { return success_; }
  bool is_err() const { return !success_; }

  // Value access (undefined behavior if wrong state)
  T &value() { return value_; }
  const T &value() const { return value_; }

  E &error() { return error_; }
  const E &error() const { return error_; }

  T value_or(const T &default_val) const {
    if (success_) {
      return value_;
    }
    return default_val;
  }

  // Re-wrap an error into a Result of another value type, for propagation
  template <typename U> Result<U, E> forward_err() const { return Result<U, E>::err(error_); }

  operator bool() const { return success_; }

  T &operator*() { return value_; }
  const T &operator*() const { return value_; }

  T *operator->() { return &value_; }
  const T *operator->() const { return &value_; }
};

#endif // PW_LIB_RESULT_HPP
