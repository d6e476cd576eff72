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

#include <catch.hpp>
#include "Approx.hpp"

#include <cmath>
#include <memory>
#include <vector>

#include "common/JsonParameterProvider.hpp"
#include "griddae/Exceptions.hpp"
#include "ModelFactory.hpp"
#include "ComplexArithmetic.hpp"
#include "model/NodeModel.hpp"
#include "model/LineModel.hpp"

namespace
{
	std::unique_ptr<griddae::model::INodeModel> createNode(const std::string& type, griddae::JsonParameterProvider& jpp)
	{
		const griddae::ModelFactory factory;
		std::unique_ptr<griddae::model::INodeModel> node(factory.createNode(type));
		REQUIRE(node);
		REQUIRE(node->configure(jpp));
		return node;
	}

	std::unique_ptr<griddae::model::ILineModel> createLine(const std::string& type, griddae::JsonParameterProvider& jpp)
	{
		const griddae::ModelFactory factory;
		std::unique_ptr<griddae::model::ILineModel> line(factory.createLine(type));
		REQUIRE(line);
		REQUIRE(line->configure(jpp));
		return line;
	}

	griddae::JsonParameterProvider swingConfig()
	{
		griddae::JsonParameterProvider jpp("{}");
		jpp.set("H", 2.0);
		jpp.set("P", 0.5);
		jpp.set("D", 0.1);
		jpp.set("OMEGA", 50.0);
		jpp.set("GAMMA", 0.5);
		jpp.set("V", 1.0);
		return jpp;
	}
}

TEST_CASE("Slack node holds reference voltage", "[NodeModel],[SlackAlgebraic]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("U", std::vector<double>{1.02, -0.01});
	std::unique_ptr<griddae::model::INodeModel> node = createNode("SlackAlgebraic", jpp);

	CHECK(node->numDofs() == 2);
	CHECK_FALSE(node->isDifferential(0));
	CHECK_FALSE(node->isDifferential(1));
	CHECK(std::string(node->variableName(0)) == "u_r");

	double uRe = 0.0;
	double uIm = 0.0;
	REQUIRE(node->referenceVoltage(uRe, uIm));
	CHECK(uRe == 1.02);
	CHECK(uIm == -0.01);

	std::vector<double> p(node->numParameters());
	node->defaultParameters(p.data());

	const double u[] = {1.0, 0.0};
	double du[2];
	node->dynamics(0.0, u, griddae::util::Complex<double>(3.0, 4.0), p.data(), du);
	CHECK(du[0] == griddae::test::RelApprox(-0.02));
	CHECK(du[1] == griddae::test::RelApprox(0.01));
}

TEST_CASE("Slack node accepts real scalar voltage", "[NodeModel],[SlackAlgebraic]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("U", 1.0);
	std::unique_ptr<griddae::model::INodeModel> node = createNode("SlackAlgebraic", jpp);

	double uRe = 0.0;
	double uIm = 1.0;
	node->referenceVoltage(uRe, uIm);
	CHECK(uRe == 1.0);
	CHECK(uIm == 0.0);
}

TEST_CASE("PQ node residual vanishes at prescribed power", "[NodeModel],[PQAlgebraic]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("P", -0.5);
	jpp.set("Q", 0.25);
	std::unique_ptr<griddae::model::INodeModel> node = createNode("PQAlgebraic", jpp);

	double uRe = 0.0;
	double uIm = 0.0;
	CHECK_FALSE(node->referenceVoltage(uRe, uIm));

	std::vector<double> p(2);
	node->defaultParameters(p.data());
	CHECK(p[0] == -0.5);
	CHECK(p[1] == 0.25);

	// u * conj(i) = S  <=>  i = conj(S / u), with u = 1 we get i = conj(S)
	const double u[] = {1.0, 0.0};
	double du[2];
	node->dynamics(0.0, u, griddae::util::Complex<double>(-0.5, -0.25), p.data(), du);
	CHECK(std::abs(du[0]) <= 1e-15);
	CHECK(std::abs(du[1]) <= 1e-15);
}

TEST_CASE("PV node residual", "[NodeModel],[PVAlgebraic]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("P", 0.3);
	jpp.set("V", 1.0);
	std::unique_ptr<griddae::model::INodeModel> node = createNode("PVAlgebraic", jpp);

	std::vector<double> p(2);
	node->defaultParameters(p.data());

	const double u[] = {0.6, 0.8};
	double du[2];
	node->dynamics(0.0, u, griddae::util::Complex<double>(0.5, 0.0), p.data(), du);
	CHECK(du[0] == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
	CHECK(du[1] == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
}

TEST_CASE("Swing equation rotates voltage and accelerates with power imbalance", "[NodeModel],[SwingEq]")
{
	griddae::JsonParameterProvider jpp = swingConfig();
	std::unique_ptr<griddae::model::INodeModel> node = createNode("SwingEq", jpp);

	CHECK(node->numDofs() == 3);
	CHECK(node->isDifferential(2));
	CHECK_FALSE(node->supportsOperationPoint());

	std::vector<double> p(1);
	node->defaultParameters(p.data());

	const double u[] = {1.0, 0.0, 0.2};
	double du[3];
	node->dynamics(0.0, u, griddae::util::Complex<double>(0.3, 0.0), p.data(), du);

	CHECK(du[0] == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
	CHECK(du[1] == griddae::test::RelApprox(0.2));
	// (P - D omega - P_e) * 2 pi Omega / H
	CHECK(du[2] == griddae::test::RelApprox((0.5 - 0.02 - 0.3) * 2.0 * 3.14159265358979323846 * 50.0 / 2.0));
}

TEST_CASE("Swing equation with voltage damping pulls magnitude to setpoint", "[NodeModel],[SwingEqLVS]")
{
	griddae::JsonParameterProvider jpp = swingConfig();
	std::unique_ptr<griddae::model::INodeModel> node = createNode("SwingEqLVS", jpp);
	CHECK(node->supportsOperationPoint());

	std::vector<double> p(1);
	node->defaultParameters(p.data());

	const double u[] = {2.0, 0.0, 0.0};
	double du[3];
	node->dynamics(0.0, u, griddae::util::Complex<double>(0.0, 0.0), p.data(), du);

	// -u / |u| * Gamma * (|u| - V) = -0.5
	CHECK(du[0] == griddae::test::RelApprox(-0.5));
	CHECK(du[1] == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
}

TEST_CASE("Synchronous machines are differential in all variables", "[NodeModel],[SynchronousMachine]")
{
	griddae::JsonParameterProvider jpp = swingConfig();
	jpp.set("E_F", 1.0);
	jpp.set("T_D_DASH", 0.5);
	jpp.set("T_Q_DASH", 0.4);
	jpp.set("X_D", 1.0);
	jpp.set("X_D_DASH", 0.2);
	jpp.set("X_Q", 0.9);
	jpp.set("X_Q_DASH", 0.3);

	const char* types[] = {"ThirdOrderEq", "FourthOrderEq"};
	for (const char* type : types)
	{
		INFO("Node model " << type);
		std::unique_ptr<griddae::model::INodeModel> node = createNode(type, jpp);
		REQUIRE(node->numDofs() == 4);
		for (unsigned int i = 0; i < 4; ++i)
			CHECK(node->isDifferential(i));

		CHECK(std::string(node->variableName(2)) == "θ");

		std::vector<double> p(1);
		node->defaultParameters(p.data());

		const double u[] = {1.0, 0.1, 0.3, 0.05};
		double du[4];
		node->dynamics(0.0, u, griddae::util::Complex<double>(0.4, -0.1), p.data(), du);
		CHECK(du[2] == 0.05);
		for (unsigned int i = 0; i < 4; ++i)
			CHECK(std::isfinite(du[i]));
	}
}

TEST_CASE("Variable access out of range throws", "[NodeModel]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("P", 0.0);
	jpp.set("Q", 0.0);
	std::unique_ptr<griddae::model::INodeModel> node = createNode("PQAlgebraic", jpp);

	CHECK_THROWS_AS(node->variableName(2), griddae::DimensionError);
	CHECK_THROWS_AS(node->isDifferential(5), griddae::DimensionError);
}

TEST_CASE("Missing complex parameter throws", "[NodeModel],[SlackAlgebraic]")
{
	const griddae::ModelFactory factory;
	std::unique_ptr<griddae::model::INodeModel> node(factory.createNode("SlackAlgebraic"));
	griddae::JsonParameterProvider jpp("{}");
	CHECK_THROWS_AS(node->configure(jpp), griddae::InvalidParameterException);

	jpp.set("U", std::vector<double>{1.0, 0.0, 0.0});
	CHECK_THROWS_AS(node->configure(jpp), griddae::InvalidParameterException);
}

TEST_CASE("Static line conducts proportional to voltage difference", "[LineModel],[StaticLine]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("Y", std::vector<double>{10.0, -30.0});
	std::unique_ptr<griddae::model::ILineModel> line = createLine("StaticLine", jpp);

	griddae::util::Complex<double> iSrc;
	griddae::util::Complex<double> iDst;
	line->currents(griddae::util::Complex<double>(1.0, 0.0), griddae::util::Complex<double>(0.9, 0.1), iSrc, iDst);

	// (10 - 30i) * (0.1 - 0.1i) = 1 - 1i - 3i - 3 = -2 - 4i
	CHECK(iSrc.re == griddae::test::RelApprox(-2.0));
	CHECK(iSrc.im == griddae::test::RelApprox(-4.0));
	CHECK(iDst.re == griddae::test::RelApprox(2.0));
	CHECK(iDst.im == griddae::test::RelApprox(4.0));
}

TEST_CASE("Pi model line without shunts and taps equals static line", "[LineModel],[PiModelLine]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("Y", std::vector<double>{2.0, -5.0});
	std::unique_ptr<griddae::model::ILineModel> pi = createLine("PiModelLine", jpp);
	std::unique_ptr<griddae::model::ILineModel> stat = createLine("StaticLine", jpp);

	const griddae::util::Complex<double> uSrc(1.0, 0.05);
	const griddae::util::Complex<double> uDst(0.97, -0.02);

	griddae::util::Complex<double> iSrcPi, iDstPi, iSrc, iDst;
	pi->currents(uSrc, uDst, iSrcPi, iDstPi);
	stat->currents(uSrc, uDst, iSrc, iDst);

	CHECK(iSrcPi.re == griddae::test::RelApprox(iSrc.re));
	CHECK(iSrcPi.im == griddae::test::RelApprox(iSrc.im));
	CHECK(iDstPi.re == griddae::test::RelApprox(iDst.re));
	CHECK(iDstPi.im == griddae::test::RelApprox(iDst.im));
}

TEST_CASE("Pi model line shunt draws current at equal voltages", "[LineModel],[PiModelLine]")
{
	griddae::JsonParameterProvider jpp("{}");
	jpp.set("Y", std::vector<double>{2.0, -5.0});
	jpp.set("Y_SHUNT_KM", std::vector<double>{0.0, 0.1});
	std::unique_ptr<griddae::model::ILineModel> pi = createLine("PiModelLine", jpp);

	const griddae::util::Complex<double> u(1.0, 0.0);
	griddae::util::Complex<double> iSrc, iDst;
	pi->currents(u, u, iSrc, iDst);

	CHECK(iSrc.re == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
	CHECK(iSrc.im == griddae::test::RelApprox(0.1));
	CHECK(iDst.re == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
	CHECK(iDst.im == griddae::test::makeApprox(0.0, 1e-12, 1e-14));
}

TEST_CASE("Model factory rejects duplicate registration", "[ModelFactory]")
{
	griddae::ModelFactory factory;
	CHECK(factory.existsNode("SwingEqLVS"));
	CHECK(factory.existsLine("PiModelLine"));
	CHECK_FALSE(factory.existsNode("Unknown"));
	CHECK(factory.createNode("Unknown") == nullptr);
	CHECK_THROWS_AS(factory.registerNodeModel("PQAlgebraic", []() -> griddae::model::INodeModel* { return nullptr; }), griddae::InvalidParameterException);
}
