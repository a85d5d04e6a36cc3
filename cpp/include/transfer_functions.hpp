#pragma once

#include "NumCpp.hpp"
#include "config.hpp"

namespace chromat {
namespace models {

// All transfer functions are element-wise and return an array of the input
// shape. Normalised quantities follow the ScaleMode domain-range scale "1".

// -----------------------------------------------------------------------------
// Display and camera encodings
// -----------------------------------------------------------------------------

// IEC 61966-2-1 sRGB.
nc::NdArray<double> eotf_inverse_sRGB(const nc::NdArray<double>& L, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> eotf_sRGB(const nc::NdArray<double>& V, config::ScaleMode scale = config::ScaleMode::Reference);

// ITU-R BT.709.
nc::NdArray<double> oetf_BT709(const nc::NdArray<double>& L, config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> oetf_inverse_BT709(const nc::NdArray<double>& V, config::ScaleMode scale = config::ScaleMode::Reference);

// ITU-R BT.2020, 10-bit system constants unless is_12_bits_system.
nc::NdArray<double> oetf_BT2020(const nc::NdArray<double>& E,
                                bool is_12_bits_system = false,
                                config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> oetf_inverse_BT2020(const nc::NdArray<double>& E_p,
                                        bool is_12_bits_system = false,
                                        config::ScaleMode scale = config::ScaleMode::Reference);

// ROMM RGB / ProPhoto RGB.
nc::NdArray<double> cctf_encoding_ProPhotoRGB(const nc::NdArray<double>& X,
                                              config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> cctf_decoding_ProPhotoRGB(const nc::NdArray<double>& X_p,
                                              config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// SMPTE ST 2084 (PQ) and DCDM
// -----------------------------------------------------------------------------

constexpr double ST2084_PEAK_LUMINANCE = 10000.0;

// C in cd/m^2 -> non-linear N.
nc::NdArray<double> eotf_inverse_ST2084(const nc::NdArray<double>& C,
                                        double L_p = ST2084_PEAK_LUMINANCE,
                                        config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> eotf_ST2084(const nc::NdArray<double>& N,
                                double L_p = ST2084_PEAK_LUMINANCE,
                                config::ScaleMode scale = config::ScaleMode::Reference);

// Digital Cinema Distribution Master, 12-bit code values when out_int / in_int.
nc::NdArray<double> eotf_inverse_DCDM(const nc::NdArray<double>& XYZ,
                                      bool out_int = false,
                                      config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> eotf_DCDM(const nc::NdArray<double>& XYZ_p,
                              bool in_int = false,
                              config::ScaleMode scale = config::ScaleMode::Reference);

// -----------------------------------------------------------------------------
// ACES log encodings
// -----------------------------------------------------------------------------

nc::NdArray<double> log_encoding_ACEScc(const nc::NdArray<double>& lin_AP1,
                                        config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> log_decoding_ACEScc(const nc::NdArray<double>& ACEScc,
                                        config::ScaleMode scale = config::ScaleMode::Reference);

nc::NdArray<double> log_encoding_ACEScct(const nc::NdArray<double>& lin_AP1,
                                         config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> log_decoding_ACEScct(const nc::NdArray<double>& ACEScct,
                                         config::ScaleMode scale = config::ScaleMode::Reference);

/**
 * @brief ACESproxy log encoding.
 * @param bit_depth 10 or 12.
 * @param out_int Return integral code values instead of normalised values.
 */
nc::NdArray<double> log_encoding_ACESproxy(const nc::NdArray<double>& lin_AP1,
                                           int bit_depth = 10,
                                           bool out_int = false,
                                           config::ScaleMode scale = config::ScaleMode::Reference);
nc::NdArray<double> log_decoding_ACESproxy(const nc::NdArray<double>& ACESproxy,
                                           int bit_depth = 10,
                                           bool in_int = false,
                                           config::ScaleMode scale = config::ScaleMode::Reference);

} // namespace models
} // namespace chromat
