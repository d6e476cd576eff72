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
 * Builders for small grid configurations used in tests.
 */

#ifndef GRIDDAETEST_GRIDHELPER_HPP_
#define GRIDDAETEST_GRIDHELPER_HPP_

#include "common/JsonParameterProvider.hpp"
#include "PowerGrid.hpp"
#include "ModelFactory.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace griddae
{
namespace test
{

	/**
	 * @brief Creates a grid configuration without any nodes or lines
	 */
	inline JsonParameterProvider emptyGridConfig(int nNodes, int nLines)
	{
		JsonParameterProvider jpp("{}");
		jpp.set("NNODES", nNodes);
		jpp.set("NLINES", nLines);
		return jpp;
	}

	inline std::string nodeScope(int idx)
	{
		char buf[16];
		snprintf(buf, sizeof(buf), "node_%03d", idx);
		return buf;
	}

	inline std::string lineScope(int idx)
	{
		char buf[16];
		snprintf(buf, sizeof(buf), "line_%03d", idx);
		return buf;
	}

	inline void addSlack(JsonParameterProvider& jpp, int idx, double uRe, double uIm)
	{
		jpp.addScope(nodeScope(idx));
		jpp.pushScope(nodeScope(idx));
		jpp.set("NODE_TYPE", "SlackAlgebraic");
		jpp.set("U", std::vector<double>{uRe, uIm});
		jpp.popScope();
	}

	inline void addPQ(JsonParameterProvider& jpp, int idx, double P, double Q)
	{
		jpp.addScope(nodeScope(idx));
		jpp.pushScope(nodeScope(idx));
		jpp.set("NODE_TYPE", "PQAlgebraic");
		jpp.set("P", P);
		jpp.set("Q", Q);
		jpp.popScope();
	}

	inline void addSwing(JsonParameterProvider& jpp, int idx, const std::string& type, double P)
	{
		jpp.addScope(nodeScope(idx));
		jpp.pushScope(nodeScope(idx));
		jpp.set("NODE_TYPE", type);
		jpp.set("H", 1.0);
		jpp.set("P", P);
		jpp.set("D", 0.1);
		jpp.set("OMEGA", 50.0);
		jpp.set("GAMMA", 0.2);
		jpp.set("V", 1.0);
		jpp.popScope();
	}

	inline void addStaticLine(JsonParameterProvider& jpp, int idx, int src, int dst, double yRe, double yIm)
	{
		jpp.addScope(lineScope(idx));
		jpp.pushScope(lineScope(idx));
		jpp.set("LINE_TYPE", "StaticLine");
		jpp.set("SOURCE", src);
		jpp.set("DESTINATION", dst);
		jpp.set("Y", std::vector<double>{yRe, yIm});
		jpp.popScope();
	}

	/**
	 * @brief Slack node @c 1 + 0i and two PQ loads on a path 0 - 1 - 2
	 */
	inline JsonParameterProvider threeNodeLoadGridConfig()
	{
		JsonParameterProvider jpp = emptyGridConfig(3, 2);
		addSlack(jpp, 0, 1.0, 0.0);
		addPQ(jpp, 1, -0.1, -0.02);
		addPQ(jpp, 2, -0.1, -0.02);
		addStaticLine(jpp, 0, 0, 1, 10.0, -30.0);
		addStaticLine(jpp, 1, 1, 2, 10.0, -30.0);
		return jpp;
	}

	/**
	 * @brief Slack node, one swing generator of the given type, and one PQ load on a path
	 */
	inline JsonParameterProvider swingGridConfig(const std::string& swingType)
	{
		JsonParameterProvider jpp = emptyGridConfig(3, 2);
		addSlack(jpp, 0, 1.0, 0.0);
		addSwing(jpp, 1, swingType, 0.1);
		addPQ(jpp, 2, -0.1, -0.02);
		addStaticLine(jpp, 0, 0, 1, 10.0, -30.0);
		addStaticLine(jpp, 1, 1, 2, 10.0, -30.0);
		return jpp;
	}

	/**
	 * @brief Slack node followed by a path of alternating swing generators and PQ loads
	 */
	inline JsonParameterProvider pathGridConfig(int nNodes)
	{
		JsonParameterProvider jpp = emptyGridConfig(nNodes, nNodes - 1);
		addSlack(jpp, 0, 1.0, 0.0);
		for (int i = 1; i < nNodes; ++i)
		{
			if (i % 2 == 0)
				addSwing(jpp, i, "SwingEqLVS", 0.01);
			else
				addPQ(jpp, i, -0.01, -0.002);
		}
		for (int i = 0; i < nNodes - 1; ++i)
			addStaticLine(jpp, i, i, i + 1, 5.0, -15.0);
		return jpp;
	}

	inline void configureGrid(PowerGrid& grid, JsonParameterProvider jpp)
	{
		const ModelFactory factory;
		grid.configure(jpp, factory);
	}

} // namespace test
} // namespace griddae

#endif  // GRIDDAETEST_GRIDHELPER_HPP_
