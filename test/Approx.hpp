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
 * Defines a helper class for comparing two doubles in tests.
 */

#ifndef GRIDDAETEST_APPROX_HPP_
#define GRIDDAETEST_APPROX_HPP_

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

#include <catch.hpp>

namespace griddae
{
namespace test
{

	/**
	 * @brief Approximate number that checks the relative error before the absolute one
	 */
	class RelApprox
	{
	public:
		explicit RelApprox(double value) : _epsilon(std::numeric_limits<float>::epsilon() * 100.0), _margin(0.0), _value(value) { }

		RelApprox& epsilon(double newEpsilon)
		{
			_epsilon = newEpsilon;
			return *this;
		}

		RelApprox& margin(double newMargin)
		{
			_margin = newMargin;
			return *this;
		}

		friend bool operator==(double lhs, const RelApprox& rhs) { return rhs.matches(lhs); }
		friend bool operator==(const RelApprox& lhs, double rhs) { return lhs.matches(rhs); }
		friend bool operator!=(double lhs, const RelApprox& rhs) { return !rhs.matches(lhs); }
		friend bool operator!=(const RelApprox& lhs, double rhs) { return !lhs.matches(rhs); }

		std::string toString() const
		{
			std::ostringstream oss;
			oss << "RelApprox( " << _value << " )";
			return oss.str();
		}

	private:
		double _epsilon;
		double _margin;
		double _value;

		bool matches(double other) const
		{
			if (std::abs(_value - other) <= _epsilon * std::abs(_value))
				return true;
			return std::abs(_value - other) <= _margin;
		}
	};

	inline RelApprox makeApprox(double value, double relTol, double absTol)
	{
		return RelApprox(value).epsilon(relTol).margin(absTol);
	}

} // namespace test
} // namespace griddae

namespace Catch
{
	template <>
	struct StringMaker<griddae::test::RelApprox>
	{
		static std::string convert(const griddae::test::RelApprox& value)
		{
			return value.toString();
		}
	};
}

#endif  // GRIDDAETEST_APPROX_HPP_
