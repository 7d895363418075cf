#pragma once

#include <array>
#include <vector>

#include "kmeans.hpp"

namespace Swatch {
	class Palette {
	public:
		enum class Role : size_t {
			dominant = 0,
			vibrant = 1,
			muted = 2,
			dark_vibrant = 3,
			light_vibrant = 4,
			ROLE_ITEM_COUNT
		};

		static const char* role_name(Role role);

		//nullptr if nothing qualified for the role. dominant is always set on a classified palette,
		//and nullptr on one classify() never filled
		const PaletteColor* role(Role role) const;
		int role_index(Role role) const { return _roles[(size_t)role]; }

		const PaletteColor* dominant() const { return role(Role::dominant); }
		const PaletteColor* vibrant() const { return role(Role::vibrant); }
		const PaletteColor* muted() const { return role(Role::muted); }
		const PaletteColor* dark_vibrant() const { return role(Role::dark_vibrant); }
		const PaletteColor* light_vibrant() const { return role(Role::light_vibrant); }

		size_t total_population() const;

		std::vector<PaletteColor> all_colors; //descending by population

	private:
		friend bool classify(std::vector<PaletteColor> colors, Palette& out_palette);

		//indices into all_colors, -1 if none
		std::array<int, (size_t)Role::ROLE_ITEM_COUNT> _roles = { -1, -1, -1, -1, -1 };
	};

	//picks the roles out of kmeans() output. returns false (and leaves out_palette alone)
	//if there's nothing to make a palette out of
	bool classify(std::vector<PaletteColor> colors, Palette& out_palette);
}
