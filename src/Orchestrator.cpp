#include"Orchestrator.hpp"
#include"AttributeValidator.hpp"
#include"FractionNormalizer.hpp"
#include"GisExceptions.hpp"
#include"Logging.hpp"
#include"PctEngine.hpp"
#include"ReplaceEngine.hpp"

namespace zoneshift {

	std::string toString(RunState s)
	{
		switch (s) {
		case RunState::Created:
			return "Created";
		case RunState::Loaded:
			return "Loaded";
		case RunState::Classified:
			return "Classified";
		case RunState::Validated:
			return "Validated";
		case RunState::Applied:
			return "Applied";
		case RunState::Written:
			return "Written";
		case RunState::Failed:
			return "Failed";
		}
		return "unknown";
	}
	std::string toString(LayerStatus s)
	{
		switch (s) {
		case LayerStatus::Pending:
			return "pending";
		case LayerStatus::Written:
			return "written";
		case LayerStatus::Skipped:
			return "skipped";
		case LayerStatus::Missing:
			return "missing";
		case LayerStatus::Failed:
			return "failed";
		}
		return "unknown";
	}

	size_t RunSummary::count(LayerStatus s) const
	{
		return (size_t)std::count_if(layers.begin(), layers.end(), [&](const LayerOutcome& l) { return l.status == s; });
	}
	const LayerOutcome* RunSummary::find(const std::string& key) const
	{
		for (const LayerOutcome& l : layers) {
			if (l.key == key) {
				return &l;
			}
		}
		return nullptr;
	}
	int RunSummary::exitCode() const
	{
		return count(LayerStatus::Failed) > 0 ? 1 : 0;
	}

	namespace {
		bool isProportional(ProcessingMode mode) {
			return mode == ProcessingMode::ProportionalUniform || mode == ProcessingMode::ProportionalMixed;
		}

		void failLayers(const std::vector<LayerOutcome*>& unit, const std::string& message) {
			for (LayerOutcome* l : unit) {
				if (l->status != LayerStatus::Pending) {
					continue;
				}
				l->status = LayerStatus::Failed;
				l->message = message;
				logWarning(CPLSPrintf("Layer %s failed: %s", l->filename.c_str(), message.c_str()));
			}
		}
	}

	Orchestrator::Orchestrator(ScenarioConfig config) : _config(std::move(config))
	{
	}

	RunSummary Orchestrator::run()
	{
		try {
			_load();
			_classify();
			_validate();
			_apply();
		}
		catch (...) {
			_summary.state = RunState::Failed;
			throw;
		}
		return _summary;
	}

	RunState Orchestrator::state() const
	{
		return _summary.state;
	}
	const RunSummary& Orchestrator::summary() const
	{
		return _summary;
	}

	void Orchestrator::_load()
	{
		_rules = RuleSet::fromJsonFile(_config.ruleFile);
		_zones = readZoneLayer(_config.vectorFile, _config.vectorLayer);

		_summary.layers.clear();
		for (const LayerRule& rule : _rules.rules()) {
			LayerOutcome o;
			o.filename = rule.filename;
			o.key = rule.key;
			o.kind = rule.kind;
			o.group = compositionalGroup(rule.key, _config.validation.compositionalPrefixes);
			const std::string& folder = o.group ? _config.fractionsFolder : _config.ucpFolder;
			o.inputPath = (std::filesystem::path(folder) / rule.fileOnDisk()).string();
			_summary.layers.push_back(std::move(o));
		}
		_summary.state = RunState::Loaded;
		logInfo(CPLSPrintf("Loaded %d rules and %d zones", (int)_rules.size(), (int)_zones.zones.size()));
	}

	void Orchestrator::_classify()
	{
		_summary.mode = requireCoherentMode(_rules);

		for (const LayerOutcome& layer : _summary.layers) {
			if (_isRuleActive(layer) && !_zones.hasColumn(layer.key)) {
				throw UnreferencedLayerException("Layer " + layer.filename + " has a " + toString(layer.kind)
					+ " rule but the vector mask has no " + layer.key + " attribute", layer.key);
			}
		}

		for (LayerOutcome& layer : _summary.layers) {
			if (!std::filesystem::exists(layer.inputPath)) {
				layer.status = LayerStatus::Missing;
				layer.message = layer.inputPath + " not found";
				logWarning(CPLSPrintf("Missing layer: %s not found, skipping it", layer.inputPath.c_str()));
			}
		}

		_summary.state = RunState::Classified;
		logInfo("Processing mode: " + toString(_summary.mode));
	}

	void Orchestrator::_validate()
	{
		if (isProportional(_summary.mode)) {
			checkPctOptions(_config.pctOptions);
		}

		std::vector<std::string> mismatched;
		for (LayerOutcome& layer : _summary.layers) {
			if (layer.status != LayerStatus::Pending) {
				continue;
			}
			try {
				Alignment a{ layer.inputPath };
				if (!a.crs().isConsistentHoriz(_zones.crs)) {
					mismatched.push_back(layer.filename);
					logWarning(CPLSPrintf("CRS mismatch: %s is in %s, but the vector mask is in %s",
						layer.filename.c_str(), a.crs().getShortName().c_str(), _zones.crs.getShortName().c_str()));
				}
			}
			catch (const InvalidRasterFileException& e) {
				failLayers({ &layer }, e.what());
			}
		}
		if (!mismatched.empty() && _config.crsPolicy == CrsMismatchPolicy::Fail) {
			throw CrsMismatchException(std::to_string(mismatched.size()) + " raster layers don't share the CRS of the vector mask", mismatched);
		}

		if (_summary.mode == ProcessingMode::Replace) {
			validateReplaceAttributes(_zones.zones, _rules, _config.validation);
		}
		_summary.state = RunState::Validated;
	}

	void Orchestrator::_apply()
	{
		std::filesystem::create_directories(_config.outputFolder);

		if (_summary.mode == ProcessingMode::Skip) {
			for (LayerOutcome& layer : _summary.layers) {
				if (layer.status != LayerStatus::Pending) {
					continue;
				}
				if (_config.noneHandling != NoneLayerHandling::PassThrough) {
					layer.status = LayerStatus::Skipped;
					layer.message = "every rule is none";
					continue;
				}
				try {
					_passThrough(layer);
				}
				catch (const std::exception& e) {
					failLayers({ &layer }, e.what());
				}
			}
		}
		else {
			//one unit of work is either a standalone layer, or a whole compositional group at the position of its first member
			std::set<std::string> groupsDone;
			for (LayerOutcome& layer : _summary.layers) {
				std::vector<LayerOutcome*> unit;
				if (layer.group) {
					if (groupsDone.contains(layer.group.value())) {
						continue;
					}
					groupsDone.insert(layer.group.value());
					for (LayerOutcome& other : _summary.layers) {
						if (other.group == layer.group && other.status == LayerStatus::Pending) {
							unit.push_back(&other);
						}
					}
				}
				else if (layer.status == LayerStatus::Pending) {
					unit.push_back(&layer);
				}
				if (unit.empty()) {
					continue;
				}

				try {
					if (layer.group) {
						_processGroup(unit);
					}
					else {
						_processStandalone(layer);
					}
				}
				catch (const UndefinedPercentageChangeException& e) {
					//fatal under the raise policy: nothing after this unit is processed
					failLayers(unit, e.what());
					throw;
				}
				catch (const std::exception& e) {
					failLayers(unit, e.what());
				}
			}
		}
		_summary.state = RunState::Applied;

		if (isProportional(_summary.mode)) {
			_checkImdBsfConsistency();
		}
		_summary.state = RunState::Written;
		logInfo(CPLSPrintf("Run finished: %d written, %d skipped, %d missing, %d failed",
			(int)_summary.count(LayerStatus::Written), (int)_summary.count(LayerStatus::Skipped),
			(int)_summary.count(LayerStatus::Missing), (int)_summary.count(LayerStatus::Failed)));
	}

	std::vector<ZoneMask> Orchestrator::_masksFor(const Alignment& a) const
	{
		std::vector<ZoneMask> out;
		out.reserve(_zones.zones.size());
		for (const Zone& z : _zones.zones) {
			out.push_back(maskFor(z.geometry, a));
		}
		return out;
	}

	std::vector<ZoneValue> Orchestrator::_zoneValues(const std::vector<ZoneMask>& masks, const LayerOutcome& layer) const
	{
		std::vector<ZoneValue> out;
		out.reserve(masks.size());
		for (size_t i = 0; i < masks.size(); ++i) {
			const Zone& z = _zones.zones[i];
			out.push_back(ZoneValue{ &masks[i], _zoneValue(z, layer), z.index });
		}
		return out;
	}

	double Orchestrator::_zoneValue(const Zone& z, const LayerOutcome& layer) const
	{
		if (!_isRuleActive(layer)) {
			return 0.;
		}
		return z.attribute(layer.key).value_or(std::numeric_limits<double>::quiet_NaN());
	}

	void Orchestrator::_processStandalone(LayerOutcome& layer)
	{
		if (layer.kind == RuleKind::None) {
			if (_config.noneHandling == NoneLayerHandling::PassThrough) {
				_passThrough(layer);
				return;
			}
			if (_config.noneHandling == NoneLayerHandling::Omit) {
				layer.status = LayerStatus::Skipped;
				layer.message = "none rule";
				return;
			}
		}

		//zones are rasterized and applied one at a time, so only one mask is alive at once
		Raster<double> r{ layer.inputPath };
		PctOptions options = _config.pctOptions;
		bool raise = options.zeroHandling == ZeroHandling::Raise;
		if (raise) {
			//zero cells are reported for every zone together, after the last one
			options.zeroHandling = ZeroHandling::Preserve;
		}
		size_t changed = 0;
		PctReport report;
		for (const Zone& z : _zones.zones) {
			ZoneMask mask = maskFor(z.geometry, r);
			ZoneValue zv{ &mask, _zoneValue(z, layer), z.index };
			if (_summary.mode == ProcessingMode::Replace) {
				changed += applyReplace(r, { zv });
			}
			else {
				PctReport one = applyPct(r, { zv }, options, layer.key);
				changed += one.totalTouched();
				report.zones.insert(report.zones.end(), one.zones.begin(), one.zones.end());
			}
		}
		if (raise) {
			throwOnUndefinedChanges(report, layer.key);
		}
		logInfo(CPLSPrintf("%s: %s %d cells", layer.filename.c_str(),
			_summary.mode == ProcessingMode::Replace ? "replaced" : "changed", (int)changed));
		_write(r, layer);
	}

	void Orchestrator::_processGroup(const std::vector<LayerOutcome*>& members)
	{
		const std::string& group = members.front()->group.value();

		std::map<std::string, Raster<double>> rasters;
		for (const LayerOutcome* m : members) {
			rasters.try_emplace(m->key, m->inputPath);
		}
		const Raster<double>& first = rasters.at(members.front()->key);
		for (const auto& [key, r] : rasters) {
			if (!first.isSameAlignment(r)) {
				throw AlignmentMismatchException("Layer " + key + " doesn't share the grid of the other members of group " + group);
			}
		}

		//members share a grid, so the zone masks are shared too
		std::vector<ZoneMask> masks = _masksFor(first);
		ZoneMask region{ first };
		for (const ZoneMask& m : masks) {
			region.merge(m);
		}

		//fractions are only bounded below before normalization; normalizing brings them back into [0,1]
		PctOptions memberOptions = _config.pctOptions;
		memberOptions.outOfBounds = OutOfBoundsHandling::Clip;
		memberOptions.lowerBound = 0.;
		memberOptions.upperBound = std::numeric_limits<double>::infinity();

		std::map<std::string, Raster<double>*> pointers;
		for (const LayerOutcome* m : members) {
			Raster<double>& r = rasters.at(m->key);
			std::vector<ZoneValue> values = _zoneValues(masks, *m);
			if (_summary.mode == ProcessingMode::Replace) {
				applyReplace(r, values);
			}
			else {
				applyPct(r, values, memberOptions, m->key);
			}
			pointers[m->key] = &r;
		}

		normalizeGroup(group, pointers, &region);

		for (LayerOutcome* m : members) {
			_write(rasters.at(m->key), *m);
		}
	}

	void Orchestrator::_passThrough(LayerOutcome& layer)
	{
		std::filesystem::path out = std::filesystem::path(_config.outputFolder) / std::filesystem::path(layer.inputPath).filename();
		std::filesystem::copy_file(layer.inputPath, out, std::filesystem::copy_options::overwrite_existing);
		layer.status = LayerStatus::Written;
		layer.outputPath = out.string();
		layer.message = "passed through unchanged";
	}

	void Orchestrator::_write(const Raster<double>& r, LayerOutcome& layer)
	{
		//integer grids can't hold the changed values, so they're promoted
		GDALDataType source = r.sourceDataType();
		GDALDataType gdt = (source == GDT_Unknown || GDALDataTypeIsFloating(source)) ? source : GDT_Float32;

		std::string out = _outputPathFor(layer);
		r.writeRaster(out, _config.driver, gdt);
		layer.status = LayerStatus::Written;
		layer.outputPath = out;
		logInfo(CPLSPrintf("Wrote %s", out.c_str()));
	}

	std::string Orchestrator::_outputPathFor(const LayerOutcome& layer) const
	{
		std::filesystem::path in{ layer.inputPath };
		const std::string& suffix = _summary.mode == ProcessingMode::Replace ? _config.replaceSuffix : _config.pctSuffix;
		std::string name = in.stem().string() + suffix + in.extension().string();
		return (std::filesystem::path(_config.outputFolder) / name).string();
	}

	bool Orchestrator::_isRuleActive(const LayerOutcome& layer) const
	{
		return layer.kind != RuleKind::None;
	}

	void Orchestrator::_checkImdBsfConsistency()
	{
		const LayerOutcome* imd = _summary.find(_config.validation.imdKey);
		const LayerOutcome* bsf = _summary.find(_config.validation.bsfKey);
		if (!imd || !bsf || imd->status != LayerStatus::Written || bsf->status != LayerStatus::Written) {
			return;
		}
		try {
			Raster<double> imdRaster{ imd->outputPath };
			Raster<double> bsfRaster{ bsf->outputPath };
			if (!imdRaster.isSameAlignment(bsfRaster)) {
				logWarning("Cannot compare " + imd->key + " and " + bsf->key + ": they don't share a grid");
				return;
			}
			size_t below = 0;
			for (cell_t cell = 0; cell < imdRaster.ncell(); ++cell) {
				auto i = imdRaster[cell];
				auto b = bsfRaster[cell];
				if (i.has_value() && b.has_value() && i.value() < b.value()) {
					++below;
				}
			}
			_summary.imdBelowBsfPixels = below;
			if (below > 0) {
				logWarning(CPLSPrintf("%d pixels (%.2f%%) have %s < %s; consider adjusting the pct attributes of the vector mask",
					(int)below, 100. * (double)below / (double)imdRaster.ncell(), imd->key.c_str(), bsf->key.c_str()));
			}
			else {
				logInfo("Every pixel satisfies " + imd->key + " >= " + bsf->key);
			}
		}
		catch (const InvalidRasterFileException& e) {
			logWarning(std::string("Cannot check ") + imd->key + " against " + bsf->key + ": " + e.what());
		}
	}
}
