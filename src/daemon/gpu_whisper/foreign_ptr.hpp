#pragma once

#include "gpu_whisper/abi.hpp"

#include <utility>

namespace gpu_whisper {

// Owns exactly one reference to an object living on the other side of the
// binary boundary. Release is called once, from reset() or the destructor.
// The handle itself cannot be copied; share() takes another reference instead.
template <typename Vtbl>
class ForeignPtr {
public:
    ForeignPtr() = default;
    // Adopts a reference the caller already owns (an out-parameter of a foreign call).
    explicit ForeignPtr(void* raw) : ptr_(raw) {}
    ~ForeignPtr() { reset(); }

    ForeignPtr(const ForeignPtr&) = delete;
    ForeignPtr& operator=(const ForeignPtr&) = delete;

    ForeignPtr(ForeignPtr&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}
    ForeignPtr& operator=(ForeignPtr&& other) noexcept {
        if (this != &other) {
            reset();
            ptr_ = std::exchange(other.ptr_, nullptr);
        }
        return *this;
    }

    void reset() {
        if (void* p = std::exchange(ptr_, nullptr)) {
            vtable_of<Vtbl>(p)->Release(p);
        }
    }

    ForeignPtr share() const {
        if (ptr_) vtbl()->AddRef(ptr_);
        return ForeignPtr(ptr_);
    }

    void* get() const { return ptr_; }
    const Vtbl* vtbl() const { return vtable_of<Vtbl>(ptr_); }
    explicit operator bool() const { return ptr_ != nullptr; }

private:
    void* ptr_ = nullptr;
};

} // namespace gpu_whisper
