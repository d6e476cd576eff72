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
 * Complex arithmetic on real and AD scalar types
 */

#ifndef LIBGRIDDAE_COMPLEXARITHMETIC_HPP_
#define LIBGRIDDAE_COMPLEXARITHMETIC_HPP_

#include "AutoDiff.hpp"

#include <cmath>

namespace griddae
{

namespace util
{

/**
 * @brief Complex number with real and imaginary part of type @p T
 * @details @c std::complex is only specified for floating point types. This type
 *          supports both @c double and @c active and promotes mixed expressions to @c active.
 * @tparam T Scalar type (@c double or @c active)
 */
template <typename T>
struct Complex
{
	T re;
	T im;

	Complex() : re(0.0), im(0.0) { }
	Complex(const T& r, const T& i) : re(r), im(i) { }

	inline Complex<T>& operator+=(const Complex<T>& rhs)
	{
		re += rhs.re;
		im += rhs.im;
		return *this;
	}
};

template <typename A, typename B>
inline Complex<typename DoubleActivePromoter<A, B>::type> operator+(const Complex<A>& a, const Complex<B>& b)
{
	return Complex<typename DoubleActivePromoter<A, B>::type>(a.re + b.re, a.im + b.im);
}

template <typename A, typename B>
inline Complex<typename DoubleActivePromoter<A, B>::type> operator-(const Complex<A>& a, const Complex<B>& b)
{
	return Complex<typename DoubleActivePromoter<A, B>::type>(a.re - b.re, a.im - b.im);
}

template <typename A, typename B>
inline Complex<typename DoubleActivePromoter<A, B>::type> operator*(const Complex<A>& a, const Complex<B>& b)
{
	return Complex<typename DoubleActivePromoter<A, B>::type>(a.re * b.re - a.im * b.im, a.re * b.im + a.im * b.re);
}

template <typename T>
inline Complex<T> operator-(const Complex<T>& a)
{
	return Complex<T>(-a.re, -a.im);
}

/**
 * @brief Multiplies a complex number with a real scalar
 */
template <typename T, typename S>
inline Complex<typename DoubleActivePromoter<T, S>::type> scale(const Complex<T>& a, const S& s)
{
	return Complex<typename DoubleActivePromoter<T, S>::type>(a.re * s, a.im * s);
}

/**
 * @brief Multiplies a complex number with the imaginary unit
 */
template <typename T>
inline Complex<T> timesI(const Complex<T>& a)
{
	return Complex<T>(-a.im, a.re);
}

template <typename T>
inline Complex<T> conj(const Complex<T>& a)
{
	return Complex<T>(a.re, -a.im);
}

template <typename T>
inline T abs(const Complex<T>& a)
{
	using std::sqrt;
	return sqrt(a.re * a.re + a.im * a.im);
}

/**
 * @brief Computes @f$ e^{i \theta} @f$
 */
template <typename T>
inline Complex<T> expI(const T& theta)
{
	using std::cos;
	using std::sin;
	return Complex<T>(cos(theta), sin(theta));
}

} // namespace util

} // namespace griddae

#endif  // LIBGRIDDAE_COMPLEXARITHMETIC_HPP_
