#ifndef SUBTREE_BASE_NO_DESTRUCTOR_H
#define SUBTREE_BASE_NO_DESTRUCTOR_H

#include <new>
#include <utility>

namespace base {

// Holds a `T` constructed in place whose destructor never runs. Used for
// process-wide tables that must outlive every function-local static that
// might refer to them.
template <typename T>
struct NoDestructor {
  template <typename... Args>
  explicit NoDestructor(Args &&...args) {
    ::new (static_cast<void *>(buf_)) T(std::forward<Args>(args)...);
  }

  NoDestructor(NoDestructor const &) = delete;
  NoDestructor &operator=(NoDestructor const &) = delete;

  T *get() { return reinterpret_cast<T *>(buf_); }
  T const *get() const { return reinterpret_cast<T const *>(buf_); }

  T &operator*() { return *get(); }
  T const &operator*() const { return *get(); }
  T *operator->() { return get(); }
  T const *operator->() const { return get(); }

 private:
  alignas(T) unsigned char buf_[sizeof(T)];
};

}  // namespace base

#endif  // SUBTREE_BASE_NO_DESTRUCTOR_H
