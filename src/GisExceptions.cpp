#include"GisExceptions.hpp"

namespace zoneshift {

    namespace {
        std::string formatDouble(double d) {
            std::ostringstream ss;
            ss.precision(10);
            ss << d;
            return ss.str();
        }
    }

    InvalidRasterFileException::InvalidRasterFileException(const std::string& error) : std::runtime_error(error) {}
    InvalidVectorFileException::InvalidVectorFileException(const std::string& error) : std::runtime_error(error) {}
    UnsupportedVectorFormatException::UnsupportedVectorFormatException(const std::string& error) : std::runtime_error(error) {}
    CrsParseException::CrsParseException(const std::string& error) : std::runtime_error(error) {}
    AlignmentMismatchException::AlignmentMismatchException(const std::string& error) : std::runtime_error(error) {}
    InvalidAlignmentException::InvalidAlignmentException(const std::string& error) : std::runtime_error(error) {}
    OutsideExtentException::OutsideExtentException(const std::string& error) : std::runtime_error(error) {}
    WrongGeometryTypeException::WrongGeometryTypeException(const std::string& error) : std::runtime_error(error) {}
    WrongFieldTypeException::WrongFieldTypeException(const std::string& error) : std::runtime_error(error) {}
    InvalidRuleFileException::InvalidRuleFileException(const std::string& error) : std::runtime_error(error) {}

    RuleConflictException::RuleConflictException(const std::string& error, std::vector<std::string> kinds)
        : std::runtime_error(error), _kinds(std::move(kinds))
    {
    }
    const std::vector<std::string>& RuleConflictException::kinds() const
    {
        return _kinds;
    }

    UnreferencedLayerException::UnreferencedLayerException(const std::string& error, std::string layer)
        : std::runtime_error(error), _layer(std::move(layer))
    {
    }
    const std::string& UnreferencedLayerException::layer() const
    {
        return _layer;
    }

    CrsMismatchException::CrsMismatchException(const std::string& error, std::vector<std::string> layers)
        : std::runtime_error(error), _layers(std::move(layers))
    {
    }
    const std::vector<std::string>& CrsMismatchException::layers() const
    {
        return _layers;
    }

    OutOfRangeAttributeException::OutOfRangeAttributeException(size_t zone, std::string layer, double value)
        : std::runtime_error("Zone " + std::to_string(zone) + ": attribute " + layer + " = " + formatDouble(value) + " is not a finite value in [0,1]"),
        _zone(zone), _layer(std::move(layer)), _value(value)
    {
    }
    size_t OutOfRangeAttributeException::zone() const
    {
        return _zone;
    }
    const std::string& OutOfRangeAttributeException::layer() const
    {
        return _layer;
    }
    double OutOfRangeAttributeException::value() const
    {
        return _value;
    }

    LogicalInconsistencyException::LogicalInconsistencyException(size_t zone, double imd, double bsf)
        : std::runtime_error("Zone " + std::to_string(zone) + ": impervious density " + formatDouble(imd)
            + " is less than building surface fraction " + formatDouble(bsf)),
        _zone(zone), _imd(imd), _bsf(bsf)
    {
    }
    size_t LogicalInconsistencyException::zone() const
    {
        return _zone;
    }
    double LogicalInconsistencyException::imd() const
    {
        return _imd;
    }
    double LogicalInconsistencyException::bsf() const
    {
        return _bsf;
    }

    FractionSumMismatchException::FractionSumMismatchException(size_t zone, std::string group, double sum)
        : std::runtime_error("Zone " + std::to_string(zone) + ": fractions of group " + group + " sum to " + formatDouble(sum) + " instead of 1"),
        _zone(zone), _group(std::move(group)), _sum(sum)
    {
    }
    size_t FractionSumMismatchException::zone() const
    {
        return _zone;
    }
    const std::string& FractionSumMismatchException::group() const
    {
        return _group;
    }
    double FractionSumMismatchException::sum() const
    {
        return _sum;
    }

    namespace {
        std::string describeZoneCounts(const std::vector<std::pair<size_t, size_t>>& zoneCounts) {
            std::string out;
            for (const auto& [zone, count] : zoneCounts) {
                if (out.size()) {
                    out += ", ";
                }
                out += "zone " + std::to_string(zone) + ": " + std::to_string(count);
            }
            return out;
        }
    }

    UndefinedPercentageChangeException::UndefinedPercentageChangeException(std::string layer, std::vector<std::pair<size_t, size_t>> zoneCounts)
        : std::runtime_error("Zero-valued cells of " + layer + " cannot take a percentage change ("
            + describeZoneCounts(zoneCounts) + ")"),
        _layer(std::move(layer)), _zoneCounts(std::move(zoneCounts))
    {
    }
    const std::string& UndefinedPercentageChangeException::layer() const
    {
        return _layer;
    }
    const std::vector<std::pair<size_t, size_t>>& UndefinedPercentageChangeException::zoneCounts() const
    {
        return _zoneCounts;
    }
    size_t UndefinedPercentageChangeException::zone() const
    {
        return _zoneCounts.empty() ? 0 : _zoneCounts.front().first;
    }
    size_t UndefinedPercentageChangeException::count() const
    {
        size_t out = 0;
        for (const auto& zc : _zoneCounts) {
            out += zc.second;
        }
        return out;
    }
}
