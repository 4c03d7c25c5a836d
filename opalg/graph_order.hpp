//                    _
//   ___  _ __   __ _| | __ _
//  / _ \| '_ \ / _` | |/ _` |
// | (_) | |_) | (_| | | (_| |
//  \___/| .__/ \__,_|_|\__, |
//       |_|            |___/
//
// operator algebra made easier in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.


#pragma once

// C++ includes
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// opalg includes
#include <opalg/common.hpp>
#include <opalg/operator.hpp>

namespace opalg {

/**
 * @brief Post-order traversal of a composition graph
 *
 * Every node reachable from the root is listed exactly once, children
 * before parents, even when a subgraph is shared by several parents.
 * Graphs never change after construction, so a cached order stays valid as
 * long as its root is alive. Orders are cached per root with LRU eviction;
 * builds run outside the lock with a local visited set.
 */
template<typename T>
class GraphOrderingEngine
{
  public:
    using Order = std::vector<const OperatorNode<T>*>;

    explicit GraphOrderingEngine(std::size_t cache_capacity = 64)
        : cache_capacity_(cache_capacity)
    {}

    static GraphOrderingEngine& instance()
    {
        static GraphOrderingEngine engine;
        return engine;
    }

    // Uncached build
    static Order post_order(const OperatorNode<T>* root)
    {
        Order order;
        if(root == nullptr) return order;

        std::vector<std::pair<const OperatorNode<T>*, bool>> stack;
        stack.reserve(64);
        std::unordered_set<const OperatorNode<T>*> visited;
        stack.emplace_back(root, false);
        while(!stack.empty()) {
            auto [node, expanded] = stack.back();
            stack.pop_back();
            if(expanded) {
                order.push_back(node);
                continue;
            }
            // Marked on expansion, not on push: a shared child must still precede every parent
            if(!visited.insert(node).second) continue;
            stack.emplace_back(node, true);
            const auto& children = node->children();
            // Reverse push so that the first operand is emitted first
            for(auto it = children.rbegin(); it != children.rend(); ++it)
                if(!visited.count(it->get())) stack.emplace_back(it->get(), false);
        }
        return order;
    }

    /// Cached order. The returned list references nodes owned by `root`.
    std::shared_ptr<const Order> cached_post_order(const NodePtr<T>& root) const
    {
        if(!root) return std::make_shared<const Order>();
        const OperatorNode<T>* key = root.get();

        // Fast path: cache hit
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = cache_.find(key);
            if(it != cache_.end() && it->second.root.lock() == root) {
                it->second.last_used = ++use_tick_;
                return it->second.order;
            }
        }

        // Build without holding the lock
        auto order = std::make_shared<const Order>(post_order(key));

        // Publish with LRU eviction
        std::lock_guard<std::mutex> lock(mtx_);
        auto& entry = cache_[key];
        entry.root = root;
        entry.order = order;
        entry.last_used = ++use_tick_;
        if(cache_.size() > cache_capacity_) {
            auto lru = cache_.end();
            for(auto it = cache_.begin(); it != cache_.end(); ++it) {
                if(it->first == key) continue;
                if(lru == cache_.end() || it->second.last_used < lru->second.last_used) lru = it;
            }
            if(lru != cache_.end()) cache_.erase(lru);
        }
        return order;
    }

    std::size_t cache_size() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return cache_.size();
    }

  private:
    struct Entry
    {
        std::weak_ptr<const OperatorNode<T>> root;
        std::shared_ptr<const Order> order;
        uint64_t last_used = 0;
    };

    mutable std::unordered_map<const OperatorNode<T>*, Entry> cache_;
    mutable std::mutex mtx_;
    std::size_t cache_capacity_ = 64;
    mutable uint64_t use_tick_ = 0;
};

/// Number of distinct nodes reachable from `op`.
template<typename T>
std::size_t node_count(const Operator<T>& op)
{
    return GraphOrderingEngine<T>::instance().cached_post_order(op.node())->size();
}

/// Distinct primitive nodes reachable from `op`, in post-order.
template<typename T>
std::vector<Operator<T>> leaves(const Operator<T>& op)
{
    std::vector<Operator<T>> out;
    for(const auto* node : *GraphOrderingEngine<T>::instance().cached_post_order(op.node()))
        if(node->kind() == OperationKind::Primitive) out.emplace_back(node->shared_from_this());
    return out;
}

/**
 * @brief Human-readable listing of a graph, one line per distinct node
 *
 *   %0 = Primitive L1Norm (1, 5) {FUNCTIONAL, PROXIMABLE, CONVEX, LIPSCHITZ}
 *   %1 = ...
 *   %2 = Sum (%0, %1) (1, 5) {...}
 */
template<typename T>
std::string describe(const Operator<T>& op)
{
    const auto order = GraphOrderingEngine<T>::instance().cached_post_order(op.node());
    std::unordered_map<const OperatorNode<T>*, std::size_t> ids;
    std::ostringstream out;
    for(const auto* node : *order) {
        const std::size_t id = ids.size();
        ids[node] = id;
        out << "%" << id << " = " << to_string(node->kind()) << " ";
        if(node->kind() == OperationKind::Primitive) {
            out << node->name();
        } else {
            out << "(";
            for(std::size_t i = 0; i < node->children().size(); ++i)
                out << (i ? ", " : "") << "%" << ids.at(node->children()[i].get());
            out << ")";
            if(node->kind() == OperationKind::ScalarMul) out << " c=" << node->scalar();
        }
        out << " " << node->shape().str() << " " << node->properties().str();
        if(node->has(Property::Proximable)) out << " prox=" << to_string(node->traits().prox_rule);
        out << "\n";
    }
    return out.str();
}

} // namespace opalg
