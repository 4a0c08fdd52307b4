///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray2D.h
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2000-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#ifndef _DATAARRAY2D_H_
#define _DATAARRAY2D_H_

#include "Exception.h"

#include <vector>
#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A dense row-major two dimensional array.  Grid fields are stored
///		with rows indexing latitude and columns indexing longitude.
///	</summary>
template <typename T>
class DataArray2D {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray2D() {
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Constructor with allocation.
	///	</summary>
	DataArray2D(
		size_t sSize0,
		size_t sSize1,
		const T & valueInit = T()
	) {
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		Allocate(sSize0, sSize1, valueInit);
	}

public:
	///	<summary>
	///		Allocate the array, replacing any existing contents.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1,
		const T & valueInit = T()
	) {
		m_sSize[0] = sSize0;
		m_sSize[1] = sSize1;
		m_data.assign(sSize0 * sSize1, valueInit);
	}

	///	<summary>
	///		Determine if this array has any data.
	///	</summary>
	bool IsAttached() const {
		return (m_data.size() != 0);
	}

	///	<summary>
	///		Get the number of rows.
	///	</summary>
	inline size_t GetRows() const {
		return m_sSize[0];
	}

	///	<summary>
	///		Get the number of columns.
	///	</summary>
	inline size_t GetColumns() const {
		return m_sSize[1];
	}

	///	<summary>
	///		Check whether another array has the same shape.
	///	</summary>
	template <typename U>
	bool HasSameShape(const DataArray2D<U> & da) const {
		return ((da.GetRows() == GetRows()) && (da.GetColumns() == GetColumns()));
	}

	///	<summary>
	///		Set every element to the given value.
	///	</summary>
	void Fill(const T & value) {
		for (size_t i = 0; i < m_data.size(); i++) {
			m_data[i] = value;
		}
	}

	///	<summary>
	///		Reverse the order of the rows.
	///	</summary>
	void FlipRows() {
		for (size_t i = 0; i < m_sSize[0] / 2; i++) {
			size_t iOpp = m_sSize[0] - 1 - i;
			for (size_t j = 0; j < m_sSize[1]; j++) {
				T tmp = (*this)(i,j);
				(*this)(i,j) = (*this)(iOpp,j);
				(*this)(iOpp,j) = tmp;
			}
		}
	}

public:
	///	<summary>
	///		Pointer to the underlying data.
	///	</summary>
	T * data() {
		return (m_data.size() == 0)?(NULL):(&(m_data[0]));
	}

	///	<summary>
	///		Pointer to the underlying data.
	///	</summary>
	const T * data() const {
		return (m_data.size() == 0)?(NULL):(&(m_data[0]));
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline const T & operator()(size_t i, size_t j) const {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i * m_sSize[1] + j];
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t i, size_t j) {
#if defined(DEBUG_ARRAYOUTOFBOUNDS)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i * m_sSize[1] + j];
	}

private:
	///	<summary>
	///		The size of each dimension of this array.
	///	</summary>
	size_t m_sSize[2];

	///	<summary>
	///		Row-major data.
	///	</summary>
	std::vector<T> m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif

