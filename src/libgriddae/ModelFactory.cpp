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

#include "ModelFactory.hpp"
#include "model/NodeModel.hpp"
#include "model/LineModel.hpp"
#include "griddae/Exceptions.hpp"

#include <algorithm>
#include <sstream>

namespace griddae
{
	namespace model
	{
		namespace node
		{
			void registerAlgebraicNodes(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes);
			void registerSwingEquations(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes);
			void registerSynchronousMachines(std::unordered_map<std::string, std::function<model::INodeModel*()>>& nodes);
		}

		namespace line
		{
			void registerLines(std::unordered_map<std::string, std::function<model::ILineModel*()>>& lines);
		}
	}

	namespace guess
	{
		void referenceVoltageGuess(const model::INodeModel& node, double uRe, double uIm, double* local)
		{
			if (!node.hasVoltageState())
				throw UnsupportedNodeTypeError(std::string("Node model ") + node.name() + " has no voltage state (u_r, u_i)");

			std::fill(local, local + node.numDofs(), 0.0);
			local[0] = uRe;
			local[1] = uIm;
		}

		void slackGuess(const model::INodeModel& node, double uRe, double uIm, double* local)
		{
			double slackRe = 0.0;
			double slackIm = 0.0;
			if (!node.referenceVoltage(slackRe, slackIm))
				throw AssertionError(std::string("Slack guess requested for non-slack node model ") + node.name());

			if ((slackRe != uRe) || (slackIm != uIm))
			{
				std::ostringstream ss;
				ss << "Slack voltage " << slackRe << " + " << slackIm << "i differs from reference voltage " << uRe << " + " << uIm << "i";
				throw AssertionError(ss.str());
			}

			referenceVoltageGuess(node, slackRe, slackIm, local);
		}
	}

	ModelFactory::ModelFactory() : _defaultGuess(guess::referenceVoltageGuess)
	{
		model::node::registerAlgebraicNodes(_nodeModels);
		model::node::registerSwingEquations(_nodeModels);
		model::node::registerSynchronousMachines(_nodeModels);

		model::line::registerLines(_lineModels);

		registerGuess("SlackAlgebraic", guess::slackGuess);
	}

	ModelFactory::~ModelFactory() { }

	model::INodeModel* ModelFactory::createNode(const std::string& name) const
	{
		const auto it = _nodeModels.find(name);
		if (it == _nodeModels.end())
			return nullptr;

		return it->second();
	}

	model::ILineModel* ModelFactory::createLine(const std::string& name) const
	{
		const auto it = _lineModels.find(name);
		if (it == _lineModels.end())
			return nullptr;

		return it->second();
	}

	void ModelFactory::registerNodeModel(const std::string& name, std::function<model::INodeModel*()> factory)
	{
		if (_nodeModels.find(name) == _nodeModels.end())
			_nodeModels[name] = factory;
		else
			throw InvalidParameterException("INodeModel implementation with the name " + name + " is already registered and cannot be overwritten");
	}

	void ModelFactory::registerLineModel(const std::string& name, std::function<model::ILineModel*()> factory)
	{
		if (_lineModels.find(name) == _lineModels.end())
			_lineModels[name] = factory;
		else
			throw InvalidParameterException("ILineModel implementation with the name " + name + " is already registered and cannot be overwritten");
	}

	void ModelFactory::registerGuess(const std::string& name, GuessFunction guess)
	{
		if (_guesses.find(name) == _guesses.end())
			_guesses[name] = guess;
		else
			throw InvalidParameterException("Initial guess for node model " + name + " is already registered and cannot be overwritten");
	}

	const GuessFunction& ModelFactory::guessFunction(const std::string& name) const
	{
		const auto it = _guesses.find(name);
		if (it == _guesses.end())
			return _defaultGuess;

		return it->second;
	}

	bool ModelFactory::existsNode(const std::string& name) const
	{
		return _nodeModels.find(name) != _nodeModels.end();
	}

	bool ModelFactory::existsLine(const std::string& name) const
	{
		return _lineModels.find(name) != _lineModels.end();
	}

} // namespace griddae
