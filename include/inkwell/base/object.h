#pragma once

#include "types.h"
#include <inkwell/result.hpp>
#include <memory>
#include <atomic>
#include <type_traits>

namespace inkwell {
namespace base {

class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    // Public entry point: guards against double-shutdown, then calls onShutdown().
    Result<void> shutdown() {
        if (_shutdownCalled) return Ok();
        _shutdownCalled = true;
        return onShutdown();
    }

    bool isShutdown() const { return _shutdownCalled; }

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    // Cast shared_ptr to any derived type - all share same control block
    template<typename T>
    std::shared_ptr<T> sharedAs() {
        static_assert(std::is_base_of_v<Object, T>, "T must derive from Object");
        return std::dynamic_pointer_cast<T>(shared_from_this());
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() : _id(nextId()) {}

    // Override in subclasses to do cleanup while shared_ptr is still alive.
    virtual Result<void> onShutdown() { return Ok(); }

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> _counter{1};
        return _counter++;
    }

    bool _shutdownCalled = false;
    ObjectId _id;
};

} // namespace base
} // namespace inkwell
