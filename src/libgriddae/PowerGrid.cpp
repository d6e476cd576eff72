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

#include "PowerGrid.hpp"
#include "ModelFactory.hpp"
#include "model/NodeModel.hpp"
#include "model/LineModel.hpp"
#include "griddae/Exceptions.hpp"
#include "griddae/ParameterProvider.hpp"
#include "Logging.hpp"

#include <sstream>
#include <iomanip>

namespace griddae
{

PowerGrid::PowerGrid() : _offsets(1, 0), _paramOffsets(1, 0) { }

PowerGrid::~PowerGrid() GRIDDAE_NOEXCEPT
{
	for (model::ILineModel* l : _lines)
		delete l;
	for (model::INodeModel* n : _nodes)
		delete n;
}

unsigned int PowerGrid::addNode(model::INodeModel* node)
{
	_nodes.push_back(node);
	_offsets.push_back(_offsets.back() + node->numDofs());
	_paramOffsets.push_back(_paramOffsets.back() + node->numParameters());
	return _nodes.size() - 1;
}

unsigned int PowerGrid::addLine(model::ILineModel* line, int src, int dst)
{
	const int nNodes = static_cast<int>(_nodes.size());
	if ((src < 0) || (src >= nNodes) || (dst < 0) || (dst >= nNodes))
	{
		std::ostringstream ss;
		ss << "Line " << _lines.size() << " (" << line->name() << ") connects nodes " << src << " and " << dst << " but the grid has " << nNodes << " nodes";
		delete line;
		throw DimensionError(ss.str());
	}

	if (!_nodes[src]->hasVoltageState() || !_nodes[dst]->hasVoltageState())
	{
		const std::string msg = std::string("Line ") + line->name() + " is attached to a node without voltage state";
		delete line;
		throw UnsupportedNodeTypeError(msg);
	}

	_lines.push_back(line);
	_connections.push_back(src);
	_connections.push_back(dst);
	return _lines.size() - 1;
}

void PowerGrid::configure(IParameterProvider& paramProvider, const ModelFactory& factory)
{
	const int nNodes = paramProvider.getInt("NNODES");
	const int nLines = paramProvider.exists("NLINES") ? paramProvider.getInt("NLINES") : 0;

	if (nNodes < 0)
		throw InvalidParameterException("NNODES has to be non-negative");
	if (nLines < 0)
		throw InvalidParameterException("NLINES has to be non-negative");

	std::ostringstream oss;
	for (int i = 0; i < nNodes; ++i)
	{
		oss.str("");
		oss << "node_" << std::setfill('0') << std::setw(3) << std::setprecision(0) << i;

		paramProvider.pushScope(oss.str());

		const std::string nodeType = paramProvider.getString("NODE_TYPE");
		model::INodeModel* const node = factory.createNode(nodeType);
		if (!node)
		{
			paramProvider.popScope();
			throw InvalidParameterException("Unknown node type " + nodeType + " in " + oss.str());
		}

		bool success = false;
		try
		{
			success = node->configure(paramProvider);
		}
		catch (const std::exception&)
		{
			delete node;
			paramProvider.popScope();
			throw;
		}

		paramProvider.popScope();

		if (!success)
		{
			delete node;
			throw InvalidParameterException("Invalid parameters of node " + oss.str() + " (" + nodeType + ")");
		}

		addNode(node);
		LOG(Debug) << "Added node " << i << " of type " << nodeType;
	}

	for (int i = 0; i < nLines; ++i)
	{
		oss.str("");
		oss << "line_" << std::setfill('0') << std::setw(3) << std::setprecision(0) << i;

		paramProvider.pushScope(oss.str());

		const std::string lineType = paramProvider.getString("LINE_TYPE");
		model::ILineModel* const line = factory.createLine(lineType);
		if (!line)
		{
			paramProvider.popScope();
			throw InvalidParameterException("Unknown line type " + lineType + " in " + oss.str());
		}

		bool success = false;
		int src = -1;
		int dst = -1;
		try
		{
			src = paramProvider.getInt("SOURCE");
			dst = paramProvider.getInt("DESTINATION");
			success = line->configure(paramProvider);
		}
		catch (const std::exception&)
		{
			delete line;
			paramProvider.popScope();
			throw;
		}

		paramProvider.popScope();

		if (!success)
		{
			delete line;
			throw InvalidParameterException("Invalid parameters of line " + oss.str() + " (" + lineType + ")");
		}

		addLine(line, src, dst);
		LOG(Debug) << "Added line " << i << " of type " << lineType << " from " << src << " to " << dst;
	}
}

std::vector<double> PowerGrid::defaultParameters() const
{
	std::vector<double> p(numParameters(), 0.0);
	for (std::size_t i = 0; i < _nodes.size(); ++i)
		_nodes[i]->defaultParameters(p.data() + _paramOffsets[i]);

	return p;
}

int PowerGrid::slackIndex() const GRIDDAE_NOEXCEPT
{
	double uRe = 0.0;
	double uIm = 0.0;
	for (std::size_t i = 0; i < _nodes.size(); ++i)
	{
		if (_nodes[i]->referenceVoltage(uRe, uIm))
			return static_cast<int>(i);
	}

	return -1;
}

unsigned int PowerGrid::variableIndex(unsigned int nodeIdx, const std::string& varName) const
{
	if (nodeIdx >= _nodes.size())
		throw DimensionError("Node index " + std::to_string(nodeIdx) + " exceeds the " + std::to_string(_nodes.size()) + " nodes of the grid");

	const model::INodeModel& n = *_nodes[nodeIdx];
	for (unsigned int i = 0; i < n.numDofs(); ++i)
	{
		if (varName == n.variableName(i))
			return _offsets[nodeIdx] + i;
	}

	throw InvalidParameterException("Node " + std::to_string(nodeIdx) + " (" + n.name() + ") has no variable " + varName);
}

} // namespace griddae
