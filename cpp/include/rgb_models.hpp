#pragma once

#include "NumCpp.hpp"
#include "config.hpp"

namespace chromat {
namespace models {

// Cylindrical and subtractive representations of (output-referred) RGB.
// Every component, including hue, is normalised to [0, 1] at the reference
// scale. Inputs are N x 3 (N x 4 for CMYK).

nc::NdArray<double> RGB_to_HSV(const nc::NdArray<double>& RGB, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> HSV_to_RGB(const nc::NdArray<double>& HSV, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> RGB_to_HSL(const nc::NdArray<double>& RGB, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> HSL_to_RGB(const nc::NdArray<double>& HSL, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> RGB_to_CMY(const nc::NdArray<double>& RGB, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> CMY_to_RGB(const nc::NdArray<double>& CMY, config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> CMY_to_CMYK(const nc::NdArray<double>& CMY, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> CMYK_to_CMY(const nc::NdArray<double>& CMYK, config::ScaleMode scale = config::ScaleMode::Reference);

} // namespace models
} // namespace chromat
