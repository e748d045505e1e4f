#pragma once

#include <new>
#include <type_traits>
#include <utility>

namespace hellosvc {
namespace core {

/**
 * Error kinds for result<T>.
 *
 * Closed set: every failure the service can report maps to exactly one of
 * these, and error_name() covers them all.
 */
enum class error_code : int {
    success = 0,
    invalid_state = 1,
    timeout = 2,
    internal_error = 3,    // Unknown / unclassified failure
    parse_error = 4,       // Malformed HTTP request
    payload_too_large = 5, // Body exceeds configured limit
    config_error = 6,      // Invalid environment / .env value
    address_in_use = 7,    // bind(): EADDRINUSE
    permission_denied = 8, // bind(): EACCES / EPERM
    bind_failed = 9,       // Any other listen-socket setup failure
    route_not_found = 10,  // No (method, path) entry in the router
    handler_failure = 11   // Route handler threw
};

/**
 * Stable name for an error kind (used in log lines).
 */
constexpr const char* error_name(error_code code) noexcept {
    switch (code) {
        case error_code::success:           return "Success";
        case error_code::invalid_state:     return "InvalidState";
        case error_code::timeout:           return "Timeout";
        case error_code::internal_error:    return "Unknown";
        case error_code::parse_error:       return "ParseError";
        case error_code::payload_too_large: return "PayloadTooLarge";
        case error_code::config_error:      return "ConfigError";
        case error_code::address_in_use:    return "PortInUse";
        case error_code::permission_denied: return "PermissionDenied";
        case error_code::bind_failed:       return "BindFailed";
        case error_code::route_not_found:   return "RouteNotFound";
        case error_code::handler_failure:   return "HandlerFailure";
    }
    return "Unknown";
}

/**
 * Exception-free result type.
 *
 * Either contains a value T or an error code.
 *
 * Usage:
 *   result<Config> load() {
 *       if (bad) return error_code::config_error;
 *       return cfg;
 *   }
 *
 *   auto r = load();
 *   if (r.is_ok()) use(r.value());
 *   else report(r.error());
 */
template<typename T>
class result {
public:
    /**
     * Default constructor creates an error result.
     */
    result() noexcept
        : has_value_(false), error_(error_code::invalid_state) {}

    result(const T& val) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(val);
    }

    result(T&& val) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(std::move(val));
    }

    result(error_code err) noexcept
        : has_value_(false), error_(err) {}

    result(const result& other)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(other.value());
        }
    }

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
        }
    }

    result& operator=(result other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        reset();
        has_value_ = other.has_value_;
        error_ = other.error_;
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
        }
        return *this;
    }

    ~result() {
        reset();
    }

    bool is_ok() const noexcept { return has_value_; }
    bool is_err() const noexcept { return !has_value_; }

    /**
     * Get the value (undefined behavior if is_err()).
     */
    T& value() & noexcept {
        return *std::launder(reinterpret_cast<T*>(value_storage_));
    }

    const T& value() const& noexcept {
        return *std::launder(reinterpret_cast<const T*>(value_storage_));
    }

    T&& value() && noexcept {
        return std::move(*std::launder(reinterpret_cast<T*>(value_storage_)));
    }

    /**
     * Get the error code (success if is_ok()).
     */
    error_code error() const noexcept {
        return has_value_ ? error_code::success : error_;
    }

    T value_or(T default_value) const& {
        return has_value_ ? value() : std::move(default_value);
    }

    explicit operator bool() const noexcept { return has_value_; }

private:
    void reset() noexcept {
        if (has_value_) {
            value().~T();
            has_value_ = false;
        }
    }

    alignas(T) unsigned char value_storage_[sizeof(T)];
    bool has_value_;
    error_code error_{error_code::success};
};

/**
 * Specialization for void (only indicates success/error).
 */
template<>
class result<void> {
public:
    result() noexcept : error_(error_code::success) {}
    result(error_code err) noexcept : error_(err) {}

    bool is_ok() const noexcept { return error_ == error_code::success; }
    bool is_err() const noexcept { return error_ != error_code::success; }
    error_code error() const noexcept { return error_; }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    error_code error_;
};

template<typename T>
result<T> ok(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return result<T>(std::move(value));
}

inline result<void> ok() noexcept {
    return result<void>();
}

template<typename T>
result<T> err(error_code code) noexcept {
    return result<T>(code);
}

inline result<void> err(error_code code) noexcept {
    return result<void>(code);
}

} // namespace core
} // namespace hellosvc
