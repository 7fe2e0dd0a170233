#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @brief Ошибки кэша
 *
 * - CapacityExceededError: запись не помещается даже после вытеснения
 *   всех кандидатов. Фатальна только для текущего set().
 * - TierUnavailableError: медленный тир недоступен или не ответил вовремя.
 *   TieredCache обрабатывает её сам: переходит к следующему тиру.
 * - CacheTimeoutError: истёк дедлайн, переданный вызывающим кодом.
 * - InvalidConfigurationError: некорректная конфигурация при создании.
 */

class CapacityExceededError : public std::runtime_error {
public:
    CapacityExceededError(size_t requiredBytes, size_t budgetBytes)
        : std::runtime_error("Entry of " + std::to_string(requiredBytes) +
                             " bytes does not fit into fast tier budget of " +
                             std::to_string(budgetBytes) + " bytes")
        , requiredBytes_(requiredBytes)
        , budgetBytes_(budgetBytes)
    {}

    size_t requiredBytes() const { return requiredBytes_; }
    size_t budgetBytes() const { return budgetBytes_; }

private:
    size_t requiredBytes_;
    size_t budgetBytes_;
};

class TierUnavailableError : public std::runtime_error {
public:
    TierUnavailableError(const std::string& tierName, const std::string& reason)
        : std::runtime_error("Tier '" + tierName + "' unavailable: " + reason)
        , tierName_(tierName)
    {}

    const std::string& tierName() const { return tierName_; }

private:
    std::string tierName_;
};

class CacheTimeoutError : public std::runtime_error {
public:
    explicit CacheTimeoutError(const std::string& operation)
        : std::runtime_error("Deadline exceeded during " + operation)
    {}
};

class InvalidConfigurationError : public std::invalid_argument {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::invalid_argument("Invalid cache configuration: " + what)
    {}
};
