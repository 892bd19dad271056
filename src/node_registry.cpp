// ============================================================================
// node_registry.cpp: implementation for meshgate/node_registry.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "meshgate/node_registry.hpp"

namespace meshgate {

/*
 * register_if_absent()
 * --------------------
 * map::emplace does not overwrite an existing key, which is exactly the
 * first-seen-wins rule; its bool tells us whether anything was inserted.
 */
bool NodeRegistry::register_if_absent(NodeNum node, const std::string& long_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.emplace(node, NodeInfo{long_id}).second;
}

NodeMap NodeRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_;
}

size_t NodeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

} // namespace meshgate
