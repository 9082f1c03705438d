#pragma once

/// @file service_locator.hpp
/// @brief Type-keyed registry of shared component instances.

#include <any>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "rsk/foundation/kit_result.hpp"

namespace rsk::foundation {

/// Registry holding one shared instance per type.
///
/// Lets call sites that must share a component (for example one
/// CircuitBreaker guarding one downstream dependency) find it without a
/// process-wide singleton.
///
/// Example:
/// @code
///   ServiceLocator services;
///   services.emplace<CircuitBreaker>(loop, CircuitBreakerConfig{.name = "payments"});
///
///   if (auto* breaker = services.get<CircuitBreaker>()) {
///       breaker->execute<Receipt>(charge);
///   }
/// @endcode
class ServiceLocator {
public:
    ServiceLocator() = default;
    ~ServiceLocator() = default;

    ServiceLocator(const ServiceLocator&) = delete;
    ServiceLocator& operator=(const ServiceLocator&) = delete;
    ServiceLocator(ServiceLocator&&) = default;
    ServiceLocator& operator=(ServiceLocator&&) = default;

    /// Register @p service under type T, replacing any previous one.
    template <typename T>
    void add(std::shared_ptr<T> service) {
        services_[std::type_index(typeid(T))] = std::make_any<std::shared_ptr<T>>(std::move(service));
    }

    /// Construct a T in place, register it and return it.
    template <typename T, typename... Args>
    T& emplace(Args&&... args) {
        auto service = std::make_shared<T>(std::forward<Args>(args)...);
        T& ref = *service;
        add<T>(std::move(service));
        return ref;
    }

    /// Registered instance, or nullptr.
    template <typename T>
    [[nodiscard]] T* get() const {
        auto shared = share<T>();
        return shared.get();
    }

    /// Registered instance as a shared owner, or an empty pointer.
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> share() const {
        auto it = services_.find(std::type_index(typeid(T)));
        if (it == services_.end()) {
            return nullptr;
        }
        auto ptr = std::any_cast<std::shared_ptr<T>>(&it->second);
        return ptr ? *ptr : nullptr;
    }

    /// Registered instance, or NotFound.
    template <typename T>
    [[nodiscard]] KitResult<std::shared_ptr<T>> require() const {
        if (auto shared = share<T>()) {
            return KitResult<std::shared_ptr<T>>::ok(std::move(shared));
        }
        return KitResult<std::shared_ptr<T>>::err(
            KitError(ErrorCode::NotFound,
                     std::string("no service registered for ") + typeid(T).name()));
    }

    template <typename T>
    [[nodiscard]] bool has() const {
        return services_.count(std::type_index(typeid(T))) > 0;
    }

    template <typename T>
    void remove() {
        services_.erase(std::type_index(typeid(T)));
    }

    void clear() { services_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return services_.size(); }

private:
    std::unordered_map<std::type_index, std::any> services_;
};

} // namespace rsk::foundation
