#include "palette.hpp"

#include "logging.hpp"

const char* Swatch::Palette::role_name(Role role) {
	switch(role) {
		case Role::dominant: return "dominant";
		case Role::vibrant: return "vibrant";
		case Role::muted: return "muted";
		case Role::dark_vibrant: return "dark vibrant";
		case Role::light_vibrant: return "light vibrant";
		default: return "unknown";
	}
}

const Swatch::PaletteColor* Swatch::Palette::role(Role role) const {
	int index = _roles[(size_t)role];
	if(index < 0 || (size_t)index >= all_colors.size()) { return nullptr; }
	return &all_colors[index];
}

size_t Swatch::Palette::total_population() const {
	size_t total = 0;
	for(const auto& c : all_colors) { total += c.population; }
	return total;
}

bool Swatch::classify(std::vector<PaletteColor> colors, Palette& out_palette) {
	if(colors.empty()) {
		LOGWAR("no clusters to classify, no palette available");
		return false;
	}

	const PaletteColor& dominant = colors[0];
	const double dominant_population = dominant.population ? (double)dominant.population : 1.0;

	int vibrant = -1;
	double max_vibrant_score = -1;
	int dark_vibrant = -1;
	int light_vibrant = -1;
	int muted = -1;

	//strictly greater everywhere, so the first one seen keeps ties
	const auto more_populated = [&colors](int current, size_t candidate) -> bool {
		return current < 0 || colors[candidate].population > colors[current].population;
	};

	for(size_t i = 0; i < colors.size(); i++) {
		const PaletteColor& c = colors[i];
		const double sat = c.hsl.s;
		const double lum = c.hsl.l;
		const double pop_ratio = c.population / dominant_population;

		if(sat > 0.3 && sat <= 1.0 && lum > 0.3 && lum < 0.8) {
			double score = sat * (1 + pop_ratio * 0.5);
			if(score > max_vibrant_score) {
				max_vibrant_score = score;
				vibrant = (int)i;
			}
		}

		if(lum < 0.4 && sat > 0.2 && more_populated(dark_vibrant, i)) { dark_vibrant = (int)i; }
		if(lum > 0.7 && sat > 0.2 && more_populated(light_vibrant, i)) { light_vibrant = (int)i; }
		if(sat < 0.3 && lum > 0.2 && lum < 0.8 && more_populated(muted, i)) { muted = (int)i; }
	}

	if(vibrant < 0) {
		if(dominant.is_vibrant) { vibrant = 0; }
		else if(colors.size() > 1) { vibrant = 1; }
		else { vibrant = 0; }
		LOGVER("no vibrant candidate, falling back to %s", colors[vibrant].hex.c_str());
	}

	Palette palette;
	palette.all_colors = std::move(colors);
	palette._roles[(size_t)Palette::Role::dominant] = 0;
	palette._roles[(size_t)Palette::Role::vibrant] = vibrant;
	palette._roles[(size_t)Palette::Role::muted] = muted;
	palette._roles[(size_t)Palette::Role::dark_vibrant] = dark_vibrant;
	palette._roles[(size_t)Palette::Role::light_vibrant] = light_vibrant;

	out_palette = std::move(palette);
	return true;
}
