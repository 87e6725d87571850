#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

// 进程内的会话表, 按连接标识索引.
// 只有表本身加锁; 每个会话的内部状态只由持有它的连接处理线程访问.
template<typename Identity, typename Value, typename Compare = std::less<Identity>>
class SessionRegistry {
public:
    typedef std::shared_ptr<Value> ValuePtr;

    // 标识已存在时返回 nullptr
    template<typename... Args>
    ValuePtr create(const Identity& identity, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.find(identity) != entries_.end()) {
            return nullptr;
        }
        ValuePtr value = std::make_shared<Value>(std::forward<Args>(args)...);
        entries_.emplace(identity, value);
        return value;
    }

    bool add(const Identity& identity, ValuePtr value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.emplace(identity, std::move(value)).second;
    }

    // 未找到返回 nullptr
    ValuePtr lookup(const Identity& identity) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(identity);
        if (it == entries_.end()) {
            return nullptr;
        }
        return it->second;
    }

    // 返回被移除的条目, 便于调用方在锁外收尾
    ValuePtr remove(const Identity& identity) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(identity);
        if (it == entries_.end()) {
            return nullptr;
        }
        ValuePtr value = std::move(it->second);
        entries_.erase(it);
        return value;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<ValuePtr> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ValuePtr> values;
        values.reserve(entries_.size());
        for (const auto& entry : entries_) {
            values.push_back(entry.second);
        }
        return values;
    }

    std::vector<ValuePtr> clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ValuePtr> values;
        for (auto& entry : entries_) {
            values.push_back(std::move(entry.second));
        }
        entries_.clear();
        return values;
    }

private:
    std::map<Identity, ValuePtr, Compare> entries_;
    mutable std::mutex mutex_;
};
