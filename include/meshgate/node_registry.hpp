/**
 * @page mg-node-registry meshgate Node Registry
 * @file node_registry.hpp
 * @brief Roster of every mesh node heard since the daemon started.
 *
 * @details
 * PURPOSE
 * -------
 * The gateway radio hears many nodes it was never configured with. The
 * registry is the "roster" that lets a client ask "who is out there?" and
 * map a numeric node number to the long-form id users actually type
 * (`!a1b2c3d4`).
 *
 * WHAT THIS DOES
 * --------------
 * - Records a node the first time a packet carrying its long-form id is seen.
 * - Keeps that first long id forever. Later packets from the same node number
 *   never rewrite it, and nothing is ever removed.
 * - Hands out copies of the roster for readers.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - In memory only. A restart starts with an empty roster; the mesh refills
 *   it within a few beacon intervals.
 * - First-seen wins. If a node is re-flashed with a new long id under the same
 *   node number, the old id stays until restart.
 * - One mutex, held for one lookup-and-insert or one copy.
 *
 * EXAMPLE
 * -------
 * @code
 *   meshgate::NodeRegistry roster;
 *   roster.register_if_absent(0xa1b2c3d4, "!a1b2c3d4");   // true, inserted
 *   roster.register_if_absent(0xa1b2c3d4, "!ffffffff");   // false, kept "!a1b2c3d4"
 *
 *   for (const auto& kv : roster.snapshot()) {
 *       std::cout << kv.first << " -> " << kv.second.long_id << "\n";
 *   }
 * @endcode
 */
#ifndef MESHGATE_NODE_REGISTRY_HPP
#define MESHGATE_NODE_REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>

#include "meshgate/packet.hpp"

namespace meshgate {

/**
 * @struct NodeInfo
 * @brief Minimal record describing a node heard on the mesh.
 */
struct NodeInfo {
    std::string long_id;   /**< Long-form id reported by the node (e.g., "!a1b2c3d4"). */
};

using NodeMap = std::map<NodeNum, NodeInfo>;

class NodeRegistry {
public:
    /**
     * @brief Insert @p node with @p long_id unless it is already known.
     * @return true if the node was new and got inserted.
     */
    bool register_if_absent(NodeNum node, const std::string& long_id);

    /// Copy of the roster, ordered by node number.
    NodeMap snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    NodeMap            nodes_;
};

} // namespace meshgate

#endif // MESHGATE_NODE_REGISTRY_HPP
