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
 * Defines the ModelFactory
 */

#ifndef LIBGRIDDAE_MODELFACTORY_HPP_
#define LIBGRIDDAE_MODELFACTORY_HPP_

#include <string>
#include <unordered_map>
#include <functional>

namespace griddae
{

	namespace model
	{
		class INodeModel;
		class ILineModel;
	}

	/**
	 * @brief Function producing the initial guess of a node's local state
	 * @details Signature <tt>void guess(const INodeModel& node, double uRe, double uIm, double* local)</tt>
	 *          where @p uRe and @p uIm are the reference voltage of the grid and @p local points to
	 *          the node's block of the global state vector.
	 */
	typedef std::function<void(const model::INodeModel&, double, double, double*)> GuessFunction;

	namespace guess
	{
		/**
		 * @brief Sets the voltage to the reference voltage and all other variables to @c 0
		 * @throws UnsupportedNodeTypeError if the node has no voltage state
		 */
		void referenceVoltageGuess(const model::INodeModel& node, double uRe, double uIm, double* local);

		/**
		 * @brief Sets the voltage of a slack node to its own voltage
		 * @throws AssertionError if the slack voltage differs from the reference voltage
		 */
		void slackGuess(const model::INodeModel& node, double uRe, double uIm, double* local);
	}

	/**
	 * @brief Creates node and line models and provides their initial guess functions
	 */
	class ModelFactory
	{
	public:
		/**
		 * @brief Construct the ModelFactory
		 * @details All internal node and line models and guess functions are registered here.
		 */
		ModelFactory();

		~ModelFactory();

		/**
		 * @brief Creates node models with the given @p name
		 * @param [in] name Name (type tag) of the node model
		 * @return The node model or @c nullptr if a node model with this name does not exist
		 */
		model::INodeModel* createNode(const std::string& name) const;

		/**
		 * @brief Creates line models with the given @p name
		 * @param [in] name Name (type tag) of the line model
		 * @return The line model or @c nullptr if a line model with this name does not exist
		 */
		model::ILineModel* createLine(const std::string& name) const;

		/**
		 * @brief Registers the given node model implementation
		 * @param [in] name Name of the INodeModel implementation
		 * @param [in] factory Function that creates an object of the INodeModel class
		 * @throws InvalidParameterException if the name is already registered
		 */
		void registerNodeModel(const std::string& name, std::function<model::INodeModel*()> factory);

		/**
		 * @brief Registers the given line model implementation
		 * @param [in] name Name of the ILineModel implementation
		 * @param [in] factory Function that creates an object of the ILineModel class
		 * @throws InvalidParameterException if the name is already registered
		 */
		void registerLineModel(const std::string& name, std::function<model::ILineModel*()> factory);

		/**
		 * @brief Registers a type-specific initial guess function
		 * @param [in] name Name of the node model
		 * @param [in] guess Guess function
		 * @throws InvalidParameterException if a guess is already registered for this name
		 */
		void registerGuess(const std::string& name, GuessFunction guess);

		/**
		 * @brief Returns the initial guess function of a node model
		 * @details Node models without a dedicated guess use guess::referenceVoltageGuess().
		 * @param [in] name Name of the node model
		 * @return Guess function
		 */
		const GuessFunction& guessFunction(const std::string& name) const;

		bool existsNode(const std::string& name) const;
		bool existsLine(const std::string& name) const;

	protected:
		std::unordered_map<std::string, std::function<model::INodeModel*()>> _nodeModels; //!< Map with factory functions
		std::unordered_map<std::string, std::function<model::ILineModel*()>> _lineModels; //!< Map with factory functions
		std::unordered_map<std::string, GuessFunction> _guesses; //!< Map with dedicated guess functions
		GuessFunction _defaultGuess;
	};

} // namespace griddae

#endif  // LIBGRIDDAE_MODELFACTORY_HPP_
