#pragma once
#ifndef zoneshift_gisexceptions_h
#define zoneshift_gisexceptions_h

#include"zoneshift_pch.hpp"

namespace zoneshift {

	//i/o and geometry errors

	class InvalidRasterFileException : public std::runtime_error {
	public:
		InvalidRasterFileException(const std::string& error);
	};
	class InvalidVectorFileException : public std::runtime_error {
	public:
		InvalidVectorFileException(const std::string& error);
	};
	class UnsupportedVectorFormatException : public std::runtime_error {
	public:
		UnsupportedVectorFormatException(const std::string& error);
	};
	class CrsParseException : public std::runtime_error {
	public:
		CrsParseException(const std::string& error);
	};
	class AlignmentMismatchException : public std::runtime_error {
	public:
		AlignmentMismatchException(const std::string& error);
	};
	class InvalidAlignmentException : public std::runtime_error {
	public:
		InvalidAlignmentException(const std::string& error);
	};
	class OutsideExtentException : public std::runtime_error {
	public:
		OutsideExtentException(const std::string& error);
	};
	class WrongGeometryTypeException : public std::runtime_error {
	public:
		WrongGeometryTypeException(const std::string& error);
	};
	class WrongFieldTypeException : public std::runtime_error {
	public:
		WrongFieldTypeException(const std::string& error);
	};

	//rule and classification errors. All of these are raised before any raster is modified

	class InvalidRuleFileException : public std::runtime_error {
	public:
		InvalidRuleFileException(const std::string& error);
	};

	class RuleConflictException : public std::runtime_error {
	public:
		RuleConflictException(const std::string& error, std::vector<std::string> kinds);
		const std::vector<std::string>& kinds() const;
	private:
		std::vector<std::string> _kinds;
	};

	//a replace or pct rule names a layer that no attribute column in the vector mask provides
	class UnreferencedLayerException : public std::runtime_error {
	public:
		UnreferencedLayerException(const std::string& error, std::string layer);
		const std::string& layer() const;
	private:
		std::string _layer;
	};

	//raised once per run, after every offending layer has been logged
	class CrsMismatchException : public std::runtime_error {
	public:
		CrsMismatchException(const std::string& error, std::vector<std::string> layers);
		const std::vector<std::string>& layers() const;
	private:
		std::vector<std::string> _layers;
	};

	//attribute validation errors

	class OutOfRangeAttributeException : public std::runtime_error {
	public:
		OutOfRangeAttributeException(size_t zone, std::string layer, double value);
		size_t zone() const;
		const std::string& layer() const;
		double value() const;
	private:
		size_t _zone;
		std::string _layer;
		double _value;
	};

	class LogicalInconsistencyException : public std::runtime_error {
	public:
		LogicalInconsistencyException(size_t zone, double imd, double bsf);
		size_t zone() const;
		double imd() const;
		double bsf() const;
	private:
		size_t _zone;
		double _imd, _bsf;
	};

	class FractionSumMismatchException : public std::runtime_error {
	public:
		FractionSumMismatchException(size_t zone, std::string group, double sum);
		size_t zone() const;
		const std::string& group() const;
		double sum() const;
	private:
		size_t _zone;
		std::string _group;
		double _sum;
	};

	//raised by the percentage engine when zero-valued cells would receive a multiplicative change
	//one exception covers a whole layer; it carries a (zone, count) pair for every zone that reached such cells
	class UndefinedPercentageChangeException : public std::runtime_error {
	public:
		UndefinedPercentageChangeException(std::string layer, std::vector<std::pair<size_t, size_t>> zoneCounts);
		const std::string& layer() const;
		const std::vector<std::pair<size_t, size_t>>& zoneCounts() const;
		size_t zone() const; //the first offending zone
		size_t count() const; //summed over every zone
	private:
		std::string _layer;
		std::vector<std::pair<size_t, size_t>> _zoneCounts;
	};
}

#endif
