#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace runner {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数中不能让异常逃逸，否则在栈展开时会直接 terminate
    try {
        f();
    } catch (std::exception &e) {
        LOG(ERROR) << "Deferred action failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace runner
