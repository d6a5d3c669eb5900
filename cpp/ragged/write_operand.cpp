#include "write_operand.hpp"
#include "adapt.hpp"
#include "overloads.hpp"

namespace ragged {

array to_array(const maybe_value& value)
{
    return std::visit(overloads{[](const missing_t&) {
                                    return none();
                                },
                                [](const array& a) {
                                    return a;
                                }},
                      value);
}

masked_source::masked_source(array content, array mask, bool masked_when)
    : content_(std::move(content))
    , mask_(std::move(mask))
    , masked_when_(masked_when)
{
    if (!content_ || content_.dimensions() == 0) {
        throw invalid_type("masked source content must be an array with at least one dimension");
    }
    if (!mask_ || mask_.dimensions() != 1 || mask_.dtype() != dtype::boolean) {
        throw invalid_type("masked source mask must be a 1-dimensional boolean array");
    }
    if (mask_.size() != content_.size()) {
        throw shape_mismatch("mask", mask_.shape().to_string(), "content", content_.shape().to_string());
    }
}

bool masked_source::is_missing(int64_t k) const
{
    return mask_.get(k).value<bool>() == masked_when_;
}

array masked_source::at(int64_t k) const
{
    return is_missing(k) ? none() : content_.get(k);
}

} // namespace ragged
