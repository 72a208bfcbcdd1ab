#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fibermeta::catalog {

using FiberKeyValue = std::variant<std::int64_t, std::string>;

inline constexpr std::string_view kDefaultPartitionFunction = "function0";
inline constexpr std::int64_t kDefaultFiberBuckets = 1000;

// Maps a fiber-key value to the fiber value stored in the catalog. Must be
// deterministic across processes.
class PartitionFunction {
public:
    virtual ~PartitionFunction() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::int64_t apply(const FiberKeyValue& key) const = 0;
};

class BucketPartitionFunction final : public PartitionFunction {
public:
    BucketPartitionFunction(std::string name, std::int64_t buckets);

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] std::int64_t apply(const FiberKeyValue& key) const override;

    [[nodiscard]] std::int64_t buckets() const noexcept { return buckets_; }

private:
    std::string name_{};
    std::int64_t buckets_ = kDefaultFiberBuckets;
};

class IdentityPartitionFunction final : public PartitionFunction {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "identity"; }
    [[nodiscard]] std::int64_t apply(const FiberKeyValue& key) const override;
};

[[nodiscard]] std::uint64_t fnv1a_64(std::string_view bytes) noexcept;

class PartitionFunctionRegistry final {
public:
    PartitionFunctionRegistry();

    PartitionFunctionRegistry(const PartitionFunctionRegistry&) = delete;
    PartitionFunctionRegistry& operator=(const PartitionFunctionRegistry&) = delete;
    PartitionFunctionRegistry(PartitionFunctionRegistry&&) = delete;
    PartitionFunctionRegistry& operator=(PartitionFunctionRegistry&&) = delete;

    static PartitionFunctionRegistry& instance() noexcept;

    // Fails on a null function, an empty name or a name already registered.
    bool register_function(std::shared_ptr<const PartitionFunction> function);

    [[nodiscard]] std::shared_ptr<const PartitionFunction> resolve(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    void register_builtins();

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const PartitionFunction>> functions_{};
};

}  // namespace fibermeta::catalog
