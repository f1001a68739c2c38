#pragma once
#ifndef zoneshift_orchestrator_h
#define zoneshift_orchestrator_h

#include"zoneshift_pch.hpp"
#include"LayerRules.hpp"
#include"Raster.hpp"
#include"ScenarioConfig.hpp"
#include"Zone.hpp"
#include"ZoneMask.hpp"

namespace zoneshift {

	enum class RunState {
		Created, Loaded, Classified, Validated, Applied, Written, Failed
	};

	enum class LayerStatus {
		Pending, Written, Skipped, Missing, Failed
	};

	std::string toString(RunState s);
	std::string toString(LayerStatus s);

	struct LayerOutcome {
		std::string filename; //as named in the rule file
		std::string key;
		RuleKind kind = RuleKind::None;
		std::optional<std::string> group;
		std::string inputPath;
		LayerStatus status = LayerStatus::Pending;
		std::string outputPath;
		std::string message;
	};

	struct RunSummary {
		ProcessingMode mode = ProcessingMode::Skip;
		RunState state = RunState::Created;
		std::vector<LayerOutcome> layers;

		//pixels where the written impervious density is below the written building surface fraction;
		//only set after a proportional run that wrote both
		std::optional<size_t> imdBelowBsfPixels;

		size_t count(LayerStatus s) const;
		const LayerOutcome* find(const std::string& key) const;

		//0 if no layer failed, 1 otherwise
		int exitCode() const;
	};

	//Runs one scenario: Loaded -> Classified -> Validated -> Applied -> Written.
	//Everything that can make the rule set or the zone attributes unusable is detected before any output is written,
	//and is thrown out of run() after the state becomes Failed. Once writing starts, a failure only fails the layers
	//it touches; the run continues and already written layers stay. The exception is zero cells under
	//ZeroHandling::Raise, which fail their layers and then end the run the same way.
	class Orchestrator {
	public:
		explicit Orchestrator(ScenarioConfig config);

		RunSummary run();

		RunState state() const;
		const RunSummary& summary() const;

	private:
		ScenarioConfig _config;
		RunSummary _summary;
		RuleSet _rules;
		ZoneLayer _zones;

		void _load();
		void _classify();
		void _validate();
		void _apply();

		std::vector<ZoneMask> _masksFor(const Alignment& a) const;
		std::vector<ZoneValue> _zoneValues(const std::vector<ZoneMask>& masks, const LayerOutcome& layer) const;
		//NaN where the zone has no usable value for an active rule; 0 for a none rule
		double _zoneValue(const Zone& z, const LayerOutcome& layer) const;

		void _processStandalone(LayerOutcome& layer);
		void _processGroup(const std::vector<LayerOutcome*>& members);
		void _passThrough(LayerOutcome& layer);
		void _write(const Raster<double>& r, LayerOutcome& layer);
		std::string _outputPathFor(const LayerOutcome& layer) const;
		bool _isRuleActive(const LayerOutcome& layer) const;

		void _checkImdBsfConsistency();
	};
}

#endif
