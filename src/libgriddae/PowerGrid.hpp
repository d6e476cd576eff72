// =============================================================================
//  GridDAE
//  
//  Copyright © 2023-present: The GridDAE Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file 
 * Defines the PowerGrid which holds nodes, lines, and the topology of the network
 */

#ifndef LIBGRIDDAE_POWERGRID_HPP_
#define LIBGRIDDAE_POWERGRID_HPP_

#include "common/CompilerSpecific.hpp"

#include <string>
#include <vector>

namespace griddae
{

class IParameterProvider;
class ModelFactory;

namespace model
{
	class INodeModel;
	class ILineModel;
}

/**
 * @brief Ordered collection of nodes and lines connecting them
 * @details The index of a node or line is its position in the order of insertion, it never changes.
 *          The global state vector is the concatenation of the local state blocks of all nodes in
 *          node order, the global parameter vector is the concatenation of the node parameter blocks.
 *          
 *          The grid owns its models. It must not be modified while other objects (e.g., NetworkDynamics
 *          or State) refer to it.
 */
class PowerGrid
{
public:

	PowerGrid();
	~PowerGrid() GRIDDAE_NOEXCEPT;

	PowerGrid(const PowerGrid&) = delete;
	PowerGrid& operator=(const PowerGrid&) = delete;

	/**
	 * @brief Appends a node and takes ownership of it
	 * @param [in] node Configured node model
	 * @return Index of the node
	 */
	unsigned int addNode(model::INodeModel* node);

	/**
	 * @brief Appends a line between two existing nodes and takes ownership of it
	 * @details The line is deleted if it cannot be added.
	 * @param [in] line Configured line model
	 * @param [in] src Index of the source node
	 * @param [in] dst Index of the destination node
	 * @return Index of the line
	 * @throws DimensionError if @p src or @p dst is not a valid node index
	 * @throws UnsupportedNodeTypeError if an endpoint has no voltage state
	 */
	unsigned int addLine(model::ILineModel* line, int src, int dst);

	/**
	 * @brief Creates and configures nodes and lines from the given parameter provider
	 * @details The current scope has to contain @c NNODES, @c NLINES, and the scopes
	 *          @c node_XXX and @c line_XXX with three digit indices.
	 * @param [in] paramProvider Parameter provider
	 * @param [in] factory Factory for creating the models
	 * @throws InvalidParameterException on unknown model types or invalid model parameters
	 * @throws DimensionError on invalid line endpoints
	 */
	void configure(IParameterProvider& paramProvider, const ModelFactory& factory);

	inline unsigned int numNodes() const GRIDDAE_NOEXCEPT { return _nodes.size(); }
	inline unsigned int numLines() const GRIDDAE_NOEXCEPT { return _lines.size(); }

	/**
	 * @brief Returns the length of the global state vector
	 */
	inline unsigned int numDofs() const GRIDDAE_NOEXCEPT { return _offsets.back(); }

	/**
	 * @brief Returns the length of the global parameter vector
	 */
	inline unsigned int numParameters() const GRIDDAE_NOEXCEPT { return _paramOffsets.back(); }

	inline const model::INodeModel& node(unsigned int idx) const { return *_nodes[idx]; }
	inline const model::ILineModel& line(unsigned int idx) const { return *_lines[idx]; }

	inline int lineSource(unsigned int idx) const { return _connections[2 * idx]; }
	inline int lineDestination(unsigned int idx) const { return _connections[2 * idx + 1]; }

	/**
	 * @brief Returns the connection list (source and destination node of each line)
	 */
	inline int const* connections() const GRIDDAE_NOEXCEPT { return _connections.data(); }

	/**
	 * @brief Returns the offset of a node's block in the global state vector
	 */
	inline unsigned int offset(unsigned int idx) const { return _offsets[idx]; }

	/**
	 * @brief Returns the offset of a node's block in the global parameter vector
	 */
	inline unsigned int parameterOffset(unsigned int idx) const { return _paramOffsets[idx]; }

	/**
	 * @brief Returns the configured values of the global parameter vector
	 */
	std::vector<double> defaultParameters() const;

	/**
	 * @brief Returns the index of the first slack node or @c -1 if there is none
	 */
	int slackIndex() const GRIDDAE_NOEXCEPT;

	/**
	 * @brief Resolves a local variable name of a node to its global state index
	 * @param [in] nodeIdx Index of the node
	 * @param [in] varName Name of the local variable (e.g., @c u_r or @c ω)
	 * @return Index in the global state vector
	 * @throws DimensionError if @p nodeIdx is out of range
	 * @throws InvalidParameterException if the node has no variable with this name
	 */
	unsigned int variableIndex(unsigned int nodeIdx, const std::string& varName) const;

protected:
	std::vector<model::INodeModel*> _nodes; //!< Nodes in index order
	std::vector<model::ILineModel*> _lines; //!< Lines in index order
	std::vector<int> _connections; //!< Source and destination node of each line
	std::vector<unsigned int> _offsets; //!< State offset of each node, last element is the total size
	std::vector<unsigned int> _paramOffsets; //!< Parameter offset of each node, last element is the total size
};

} // namespace griddae

#endif  // LIBGRIDDAE_POWERGRID_HPP_
