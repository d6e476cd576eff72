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

#include "graph/GraphAlgos.hpp"

#include <algorithm>

namespace griddae
{

namespace graph
{

	griddae::util::SlicedVector<int> incidenceListFromConnectionList(int const* conList, int nNodes, int nLines)
	{
		griddae::util::SlicedVector<int> inc;
		for (int i = 0; i < nNodes; ++i)
		{
			inc.pushBackSlice();
			for (int j = 0; j < nLines; ++j)
			{
				if ((conList[2*j] == i) || (conList[2*j+1] == i))
					inc.pushBackInLastSlice(j);
			}
		}

		return inc;
	}

	griddae::util::SlicedVector<int> adjacencyListFromConnectionList(int const* conList, int nNodes, int nLines)
	{
		std::vector<std::vector<int>> neighbors(nNodes);
		for (int j = 0; j < nLines; ++j)
		{
			const int from = conList[2*j];
			const int to = conList[2*j+1];
			if (from == to)
				continue;

			neighbors[from].push_back(to);
			neighbors[to].push_back(from);
		}

		griddae::util::SlicedVector<int> adj;
		for (std::vector<int>& n : neighbors)
		{
			std::sort(n.begin(), n.end());
			n.erase(std::unique(n.begin(), n.end()), n.end());
			adj.pushBackSlice(n);
		}

		return adj;
	}

	int greedyColumnColoring(const griddae::util::SlicedVector<int>& rowPattern, int nCols, std::vector<int>& colors)
	{
		// Transpose pattern: rows touched by each column
		std::vector<std::vector<int>> rowsOfCol(nCols);
		for (std::size_t r = 0; r < rowPattern.slices(); ++r)
		{
			for (int const* c = rowPattern.begin(r); c != rowPattern.end(r); ++c)
				rowsOfCol[*c].push_back(static_cast<int>(r));
		}

		colors.assign(nCols, -1);

		// forbidden[k] == col marks color k as taken for the current column
		std::vector<int> forbidden(nCols, -1);
		int nColors = 0;

		for (int col = 0; col < nCols; ++col)
		{
			for (int r : rowsOfCol[col])
			{
				for (int const* c = rowPattern.begin(r); c != rowPattern.end(r); ++c)
				{
					const int clr = colors[*c];
					if (clr >= 0)
						forbidden[clr] = col;
				}
			}

			int clr = 0;
			while (forbidden[clr] == col)
				++clr;

			colors[col] = clr;
			nColors = std::max(nColors, clr + 1);
		}

		return nColors;
	}

} // namespace graph

} // namespace griddae
