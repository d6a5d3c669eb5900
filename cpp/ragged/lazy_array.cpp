#include "lazy_array.hpp"
#include "ragged.hpp"

#include <algorithm>

namespace ragged {

lazy_array::lazy_array(generator_t generator,
                       std::shared_ptr<array_cache> cache,
                       std::optional<std::string> persistent_key,
                       std::optional<enum dtype> dtype,
                       std::optional<ragged::shape> shape,
                       key_arena& arena)
    : cache_(std::move(cache))
    , persistent_key_(std::move(persistent_key))
    , dtype_(dtype)
    , arena_(&arena)
{
    set_generator(std::move(generator));
    if (shape) {
        if (shape->empty() || std::any_of(shape->begin(), shape->end(), [](int64_t d) {
                return d < 0;
            })) {
            throw invalid_shape(shape->to_string());
        }
        shape_ = std::move(shape);
    }
}

void lazy_array::set_generator(generator_t generator)
{
    if (!generator) {
        throw invalid_type("generator must be callable");
    }
    generator_ = std::move(generator);
}

void lazy_array::set_cache(std::shared_ptr<array_cache> cache)
{
    if (transient_) {
        transient_->rebind(cache);
    }
    cache_ = std::move(cache);
}

void lazy_array::set_persistent_key(std::optional<std::string> key)
{
    persistent_key_ = std::move(key);
    if (std::holds_alternative<cache_key>(held_)) {
        held_ = std::monostate();
    }
}

cache_key lazy_array::key() const
{
    if (persistent_key_) {
        return *persistent_key_;
    }
    if (!transient_) {
        transient_.emplace(*arena_, cache_);
    }
    return transient_->key();
}

bool lazy_array::is_materialized() const
{
    if (cache_ == nullptr) {
        return std::holds_alternative<array>(held_);
    }
    const auto* k = std::get_if<cache_key>(&held_);
    return k != nullptr && cache_->contains(*k);
}

array lazy_array::value() const
{
    if (std::holds_alternative<std::monostate>(held_)) {
        return materialize();
    }
    if (cache_ == nullptr) {
        if (const auto* a = std::get_if<array>(&held_)) {
            return *a;
        }
        return materialize();
    }
    if (const auto* k = std::get_if<cache_key>(&held_)) {
        if (auto found = cache_->find(*k)) {
            return *found;
        }
        log_debug(log_channel::lazy, "Cache entry {} is gone, regenerating", key_to_string(*k));
        return materialize();
    }
    auto a = std::get<array>(held_);
    store(a);
    return a;
}

array lazy_array::materialize() const
{
    auto produced = generator_();
    if (!produced || produced.is_none()) {
        throw materialization_error("generator did not produce an array");
    }
    if (produced.dimensions() == 0) {
        throw materialization_error("materialized object is scalar");
    }
    if (dtype_ && *dtype_ != produced.dtype()) {
        throw materialization_error(fmt::format("materialized array has dtype {}, expected dtype {}",
                                                dtype_to_str(produced.dtype()),
                                                dtype_to_str(*dtype_)));
    }
    if (shape_ && !(*shape_ == produced.shape())) {
        throw materialization_error(fmt::format("materialized array has shape {}, expected shape {}",
                                                produced.shape().to_string(),
                                                shape_->to_string()));
    }
    log_debug(log_channel::lazy, "Materialized array of shape {}", produced.shape().to_string());
    store(produced);
    return produced;
}

void lazy_array::store(const array& produced) const
{
    if (cache_ == nullptr) {
        held_ = produced;
        return;
    }
    auto k = key();
    cache_->insert(k, produced);
    log_debug(log_channel::cache, "Registered {} in cache", key_to_string(k));
    held_ = std::move(k);
}

enum dtype lazy_array::dtype() const
{
    return dtype_ ? *dtype_ : value().dtype();
}

ragged::shape lazy_array::shape() const
{
    return shape_ ? *shape_ : value().shape();
}

} // namespace ragged
