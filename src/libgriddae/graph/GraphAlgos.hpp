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
 * Provides algorithms for graphs
 */

#ifndef LIBGRIDDAE_GRAPHALGOS_HPP_
#define LIBGRIDDAE_GRAPHALGOS_HPP_

#include <vector>
#include "SlicedVector.hpp"

namespace griddae
{

namespace graph
{

/**
 * @brief      Lists the lines incident to each node
 * @details    A line appears once in the slice of its source and once in the slice of its
 *             destination node (only once if both coincide). Line indices in each slice are
 *             in ascending order.
 *
 * @param      conList  Connection list (2 items per line: source node, destination node)
 * @param[in]  nNodes   Number of nodes
 * @param[in]  nLines   Number of lines in @p conList
 *
 * @return     Incident lines for each node
 */
griddae::util::SlicedVector<int> incidenceListFromConnectionList(int const* conList, int nNodes, int nLines);

/**
 * @brief      Converts connection list to undirected adjacency list
 *
 * @param      conList  Connection list (2 items per line: source node, destination node)
 * @param[in]  nNodes   Number of nodes
 * @param[in]  nLines   Number of lines in @p conList
 *
 * @return     Sorted neighbors of each node, the node itself is not included
 */
griddae::util::SlicedVector<int> adjacencyListFromConnectionList(int const* conList, int nNodes, int nLines);

/**
 * @brief      Colors the columns of a sparse matrix such that columns of the same color have no common row
 * @details    Greedy distance-2 coloring of the column intersection graph. Columns are visited in
 *             ascending order and receive the smallest color that is not used by any column sharing
 *             a row with them. The number of colors bounds the number of directional derivatives needed
 *             to recover the matrix (Curtis, Powell, Reid).
 *
 * @param[in]  rowPattern  Column indices of the structural nonzeros of each row
 * @param[in]  nCols       Number of columns of the matrix
 * @param[out] colors      Color of each column
 *
 * @return     Number of colors used
 */
int greedyColumnColoring(const griddae::util::SlicedVector<int>& rowPattern, int nCols, std::vector<int>& colors);

} // namespace graph

} // namespace griddae

#endif // LIBGRIDDAE_GRAPHALGOS_HPP_
