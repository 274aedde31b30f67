#include "common/defer.hpp"
#include <utility>

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(std::function<void()> f) : f(std::move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (f) f();
}

scoped_guard scoped_guard::operator+(std::function<void()> f) const {
    return scoped_guard(std::move(f));
}

void scoped_guard::release() {
    f = nullptr;
}
