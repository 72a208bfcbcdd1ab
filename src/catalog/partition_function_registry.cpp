#include "fibermeta/catalog/partition_function_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fibermeta::catalog {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::int64_t non_negative_modulo(std::int64_t value, std::int64_t modulus) noexcept
{
    const auto remainder = value % modulus;
    return remainder < 0 ? remainder + modulus : remainder;
}

}  // namespace

std::uint64_t fnv1a_64(std::string_view bytes) noexcept
{
    auto hash = kFnvOffsetBasis;
    for (const auto ch : bytes) {
        hash ^= static_cast<std::uint8_t>(ch);
        hash *= kFnvPrime;
    }
    return hash;
}

BucketPartitionFunction::BucketPartitionFunction(std::string name, std::int64_t buckets)
    : name_{std::move(name)}
    , buckets_{buckets}
{
    if (buckets_ <= 0) {
        throw std::invalid_argument{"BucketPartitionFunction requires a positive bucket count"};
    }
}

std::int64_t BucketPartitionFunction::apply(const FiberKeyValue& key) const
{
    if (const auto* integer = std::get_if<std::int64_t>(&key)) {
        return non_negative_modulo(*integer, buckets_);
    }
    const auto hash = fnv1a_64(std::get<std::string>(key));
    return static_cast<std::int64_t>(hash % static_cast<std::uint64_t>(buckets_));
}

std::int64_t IdentityPartitionFunction::apply(const FiberKeyValue& key) const
{
    if (const auto* integer = std::get_if<std::int64_t>(&key)) {
        return *integer;
    }
    return static_cast<std::int64_t>(fnv1a_64(std::get<std::string>(key)));
}

PartitionFunctionRegistry::PartitionFunctionRegistry()
{
    register_builtins();
}

PartitionFunctionRegistry& PartitionFunctionRegistry::instance() noexcept
{
    static PartitionFunctionRegistry registry;
    return registry;
}

bool PartitionFunctionRegistry::register_function(std::shared_ptr<const PartitionFunction> function)
{
    if (!function || function->name().empty()) {
        return false;
    }

    std::scoped_lock lock(mutex_);
    auto it = std::find_if(functions_.begin(), functions_.end(), [&](const auto& existing) {
        return existing->name() == function->name();
    });
    if (it != functions_.end()) {
        return false;
    }
    functions_.push_back(std::move(function));
    return true;
}

std::shared_ptr<const PartitionFunction> PartitionFunctionRegistry::resolve(std::string_view name) const
{
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(functions_.begin(), functions_.end(), [&](const auto& function) {
        return function->name() == name;
    });
    if (it == functions_.end()) {
        return nullptr;
    }
    return *it;
}

std::vector<std::string> PartitionFunctionRegistry::names() const
{
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(functions_.size());
    for (const auto& function : functions_) {
        result.emplace_back(function->name());
    }
    std::sort(result.begin(), result.end());
    return result;
}

void PartitionFunctionRegistry::register_builtins()
{
    std::scoped_lock lock(mutex_);
    functions_.push_back(
        std::make_shared<const BucketPartitionFunction>(std::string{kDefaultPartitionFunction}, kDefaultFiberBuckets));
    functions_.push_back(std::make_shared<const IdentityPartitionFunction>());
}

}  // namespace fibermeta::catalog
