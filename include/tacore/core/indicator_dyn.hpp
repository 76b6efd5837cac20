#pragma once
// ============================================================================
// TACORE - Dynamic Indicator Interface
// ============================================================================
// Type-erased configurations and instances for hosts that choose indicators
// at runtime; DynConfig adapts any static IndicatorConfig
// ============================================================================

#include "tacore/core/indicator.hpp"

#include <memory>
#include <string_view>
#include <utility>

namespace tacore {

template <OHLC T>
class IndicatorInstanceDyn;

template <OHLC T>
class IndicatorConfigDyn {
public:
    virtual ~IndicatorConfigDyn() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual bool validate() const = 0;
    virtual SetStatus set(std::string_view name, std::string_view value) = 0;
    [[nodiscard]] virtual ResultSize size() const = 0;

    /// Throws std::invalid_argument when validate() fails
    [[nodiscard]] virtual std::unique_ptr<IndicatorInstanceDyn<T>> init(const T& bar) const = 0;

    [[nodiscard]] virtual std::unique_ptr<IndicatorConfigDyn<T>> clone() const = 0;
};

template <OHLC T>
class IndicatorInstanceDyn {
public:
    virtual ~IndicatorInstanceDyn() = default;

    virtual IndicatorResult next(const T& bar) = 0;
    [[nodiscard]] virtual const IndicatorConfigDyn<T>& config() const = 0;

    [[nodiscard]] ResultSize size() const { return config().size(); }
};

template <typename C, typename T>
    requires IndicatorInitializer<C, T>
class DynInstance;

template <typename C, typename T>
    requires IndicatorInitializer<C, T>
class DynConfig final : public IndicatorConfigDyn<T> {
public:
    DynConfig() = default;
    explicit DynConfig(C cfg) : cfg_(std::move(cfg)) {}

    [[nodiscard]] std::string_view name() const override { return C::NAME; }
    [[nodiscard]] bool validate() const override { return cfg_.validate(); }

    SetStatus set(std::string_view name, std::string_view value) override {
        return cfg_.set(name, value);
    }

    [[nodiscard]] ResultSize size() const override { return cfg_.size(); }

    [[nodiscard]] std::unique_ptr<IndicatorInstanceDyn<T>> init(const T& bar) const override {
        return std::make_unique<DynInstance<C, T>>(*this, cfg_.init(bar));
    }

    [[nodiscard]] std::unique_ptr<IndicatorConfigDyn<T>> clone() const override {
        return std::make_unique<DynConfig>(*this);
    }

    [[nodiscard]] const C& get() const noexcept { return cfg_; }

private:
    C cfg_{};
};

template <typename C, typename T>
    requires IndicatorInitializer<C, T>
class DynInstance final : public IndicatorInstanceDyn<T> {
public:
    using Instance = decltype(std::declval<const C&>().init(std::declval<const T&>()));

    DynInstance(const DynConfig<C, T>& cfg, Instance instance)
        : cfg_(cfg), instance_(std::move(instance)) {}

    IndicatorResult next(const T& bar) override { return instance_.next(bar); }

    [[nodiscard]] const IndicatorConfigDyn<T>& config() const override { return cfg_; }

    [[nodiscard]] const Instance& instance() const noexcept { return instance_; }

private:
    DynConfig<C, T> cfg_;
    Instance instance_;
};

}  // namespace tacore
