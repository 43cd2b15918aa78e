// Part of the RulesVM project, under the GNU GPL v3.
// See LICENSE for license information.

#include "vm/UriCache.hpp"

namespace rulesvm::vm
{

UriCache::UriCache(size_t capacity) : capacity_(capacity) {}

std::shared_ptr<const bytecode::Uri> UriCache::get(std::string_view text)
{
    const std::string key(text);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end())
        {
            order_.splice(order_.begin(), order_, it->second);
            return it->second->second;
        }
    }

    auto parsed = bytecode::Uri::parse(text);
    if (!parsed)
        return nullptr;
    auto uri = std::make_shared<const bytecode::Uri>(std::move(*parsed));
    if (capacity_ == 0)
        return uri;

    std::lock_guard<std::mutex> lock(mutex_);
    // Another evaluator may have inserted the same text while we parsed.
    if (auto it = index_.find(key); it != index_.end())
    {
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }
    order_.emplace_front(key, uri);
    index_.emplace(key, order_.begin());
    if (order_.size() > capacity_)
    {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
    return uri;
}

size_t UriCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

bool UriCache::contains(std::string_view text) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(std::string(text)) != 0;
}

} // namespace rulesvm::vm
