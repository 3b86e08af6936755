#include "sine_components.h"

#include <cmath>
#include <numbers>
#include <string>

namespace ShapeKit {

	namespace {
		SineComponent FromFilledRow(const ComponentRow& row, const std::string& what) {
			SineComponent c;
			c.frequency = row[0];
			c.amplitude = row[1];
			c.phase = row[2];
			c.orientation = row[3];
			c.group = GroupFromValue(row[4], what);
			return c;
		}

		SineComponent CarrierAt(const ComponentRow& row, const std::string& what) {
			return FromFilledRow(FillRow(row, {0.1, 0.0, 0.0, 0.0}, what), what);
		}

		SineComponent ModulatorAt(const ComponentRow& row, const std::string& what) {
			return FromFilledRow(FillRow(row, {1.0, 0.0, 0.0, 0.0}, what), what);
		}

		Field SumOfGroup(const std::vector<SineComponent>& components, int group, const Field& x, const Field& y) {
			Field sum = Field::Zero(x.rows(), x.cols());
			for (const auto& c : components) {
				if (c.group == group)
					sum += c.Evaluate(x, y);
			}
			return sum;
		}

		bool HasGroup(const std::vector<SineComponent>& components, int group) {
			for (const auto& c : components) {
				if (c.group == group)
					return true;
			}
			return false;
		}
	} // namespace

	SineComponent SineComponent::Carrier(const ComponentRow& row) {
		return CarrierAt(row, "sine carrier");
	}

	SineComponent SineComponent::Modulator(const ComponentRow& row) {
		return ModulatorAt(row, "sine modulator");
	}

	std::vector<SineComponent> SineComponent::Carriers(const std::vector<ComponentRow>& rows) {
		std::vector<SineComponent> out;
		out.reserve(rows.size());
		for (size_t k = 0; k < rows.size(); ++k)
			out.push_back(CarrierAt(rows[k], "sine carrier " + std::to_string(k + 1)));
		return out;
	}

	std::vector<SineComponent> SineComponent::Modulators(const std::vector<ComponentRow>& rows) {
		std::vector<SineComponent> out;
		out.reserve(rows.size());
		for (size_t k = 0; k < rows.size(); ++k)
			out.push_back(ModulatorAt(rows[k], "sine modulator " + std::to_string(k + 1)));
		return out;
	}

	Field SineComponent::Evaluate(const Field& x, const Field& y) const {
		const double to_rad = std::numbers::pi / 180.0;
		const double theta = orientation * to_rad;
		const double ph = phase * to_rad;
		return amplitude *
			(2.0 * std::numbers::pi * frequency * (x * std::cos(theta) + y * std::sin(theta)) + ph).sin();
	}

	Field CombineGroups(
		const std::map<int, Field>&       group_sums,
		const std::vector<SineComponent>& modulators,
		const Field&                      x,
		const Field&                      y
	) {
		Field result = Field::Zero(x.rows(), x.cols());
		for (const auto& [group, sum] : group_sums) {
			if (group != 0 && HasGroup(modulators, group)) {
				result += sum * SumOfGroup(modulators, group, x, y);
			} else {
				result += sum;
			}
		}

		if (HasGroup(modulators, 0)) {
			result *= SumOfGroup(modulators, 0, x, y);
		}
		return result;
	}

	Field ComposeSines(
		const std::vector<SineComponent>& carriers,
		const std::vector<SineComponent>& modulators,
		const Field&                      x,
		const Field&                      y
	) {
		if (carriers.empty())
			return Field::Zero(x.rows(), x.cols());

		std::map<int, Field> group_sums;
		for (const auto& c : carriers) {
			auto it = group_sums.find(c.group);
			if (it == group_sums.end()) {
				group_sums.emplace(c.group, c.Evaluate(x, y));
			} else {
				it->second += c.Evaluate(x, y);
			}
		}
		return CombineGroups(group_sums, modulators, x, y);
	}

} // namespace ShapeKit
