/* File: factstree.hpp
 *
 * Records rendered as PropTrees for the control channel. PropTree leaves
 * are strings, so numbers are printed in decimal and booleans as "1"/"0".
 * Empty collections still serialize as {} or [], and a missing LLDP
 * hostname as null.
 */
#ifndef DNOSTOOL_FACTSTREE_HPP_INC
#define DNOSTOOL_FACTSTREE_HPP_INC


#include <vector>

#include "proptree.hpp"
#include "records.hpp"


namespace dnostool {

PropTree ToPropTree(const ConfigBundle& configs);
PropTree ToPropTree(const EnvironmentFacts& env);
PropTree ToPropTree(const std::vector< MacTableEntry >& entries);
PropTree ToPropTree(const std::vector< ArpEntry >& entries);
// Keyed by interface name.
PropTree ToPropTree(const std::vector< InterfaceRecord >& ifaces);
PropTree ToPropTree(const LldpNeighborMap& neighbors);
// Keyed by local interface.
PropTree ToPropTree(const std::vector< LldpNeighborDetail >& details);
PropTree ToPropTree(const NtpPeerMap& peers);
PropTree ToPropTree(const DeviceFacts& facts);

} // namespace dnostool

#endif // DNOSTOOL_FACTSTREE_HPP_INC
