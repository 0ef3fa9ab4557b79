///////////////////////////////////////////////////////////////////////////////
///
///	\file    BinSpecification.h
///	\author  BLStats developers
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2026 BLStats developers
///
///		This file is distributed as part of the BLStats source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _BINSPECIFICATION_H_
#define _BINSPECIFICATION_H_

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The binning scheme of one variable: a minimum, a maximum and a bin
///		width, together with the ordered left edges of the bins
///		min, min + width, ..., up to and including max when (max - min) is
///		a whole number of widths.
///	</summary>
class BinSpecification {

public:
	///	<summary>
	///		Mapping from a value to a bin index.  Both mappings are in use:
	///		the 1D BL axis rounds to the nearest edge while both axes of the
	///		joint subsat x cape scheme are offset half a bin downward.
	///	</summary>
	enum IndexPolicy {
		IndexPolicy_RoundToNearest,
		IndexPolicy_HalfBinDown
	};

	///	<summary>
	///		Relative tolerance (in bin widths) applied when counting edges.
	///	</summary>
	static const double EdgeCountTolerance;

public:
	///	<summary>
	///		Default constructor (a single bin [0, 1]).
	///	</summary>
	BinSpecification();

	///	<summary>
	///		Constructor; validates the specification and derives edges.
	///	</summary>
	BinSpecification(
		double dMin,
		double dMax,
		double dWidth
	);

	///	<summary>
	///		Parse a specification of the form "min,max,width".  The name
	///		is used in error messages.
	///	</summary>
	static BinSpecification FromString(
		const std::string & strSpec,
		const std::string & strName
	);

	///	<summary>
	///		Derive the ordered bin edges of a specification.
	///	</summary>
	static void DeriveEdges(
		double dMin,
		double dMax,
		double dWidth,
		std::vector<double> & vecEdges
	);

public:
	inline double GetMin() const {
		return m_dMin;
	}

	inline double GetMax() const {
		return m_dMax;
	}

	inline double GetWidth() const {
		return m_dWidth;
	}

	///	<summary>
	///		Number of bins (equal to the number of edges).
	///	</summary>
	inline size_t GetBinCount() const {
		return m_vecEdges.size();
	}

	///	<summary>
	///		Ordered bin edges.
	///	</summary>
	inline const std::vector<double> & GetEdges() const {
		return m_vecEdges;
	}

	///	<summary>
	///		Compute the bin index of a value.  The result may be negative or
	///		exceed the number of bins; non-finite values map to -1.
	///	</summary>
	int ComputeBinIndex(
		double dValue,
		IndexPolicy ePolicy
	) const;

	///	<summary>
	///		True if the bin index lies in [0, GetBinCount()).
	///	</summary>
	inline bool IsInRange(int iIndex) const {
		return ((iIndex >= 0) && (static_cast<size_t>(iIndex) < m_vecEdges.size()));
	}

	///	<summary>
	///		Exact comparison of min, max and width.
	///	</summary>
	bool operator==(const BinSpecification & spec) const {
		return (
			(m_dMin == spec.m_dMin) &&
			(m_dMax == spec.m_dMax) &&
			(m_dWidth == spec.m_dWidth));
	}

	///	<summary>
	///		Formatted as "min,max,width (n bins)".
	///	</summary>
	std::string ToString() const;

private:
	///	<summary>
	///		Lower bound.
	///	</summary>
	double m_dMin;

	///	<summary>
	///		Upper bound.
	///	</summary>
	double m_dMax;

	///	<summary>
	///		Bin width.
	///	</summary>
	double m_dWidth;

	///	<summary>
	///		Ordered bin edges.
	///	</summary>
	std::vector<double> m_vecEdges;
};

///////////////////////////////////////////////////////////////////////////////

#endif

