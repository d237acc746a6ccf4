#include "lcfeat/scan.hpp"
#include "lcfeat/scan_source.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lcfeat {

Ms2Spectrum cleanMs2(const Scan& scan, Intensity intensity_threshold,
                     MZ precursor_offset) {
    if (!scan.precursor()) {
        throw std::invalid_argument("MS/MS scan without precursor");
    }

    Ms2Spectrum ms2;
    ms2.precursor_mz = scan.precursor()->mz;
    ms2.precursor_intensity = scan.precursor()->intensity;
    ms2.rt = scan.retentionTime();
    ms2.scan_index = scan.index();

    // Drop the precursor region first so it cannot set the base peak
    std::vector<MZ> mz;
    std::vector<Intensity> intensity;
    const MZ mz_limit = ms2.precursor_mz - precursor_offset;
    Intensity base_peak = 0.0;
    for (std::size_t i = 0; i < scan.size(); ++i) {
        if (scan.mzAt(i) < mz_limit) {
            mz.push_back(scan.mzAt(i));
            intensity.push_back(scan.intensityAt(i));
            base_peak = std::max(base_peak, scan.intensityAt(i));
        }
    }

    const Intensity relative_limit = 0.01 * base_peak;
    for (std::size_t i = 0; i < mz.size(); ++i) {
        if (intensity[i] > relative_limit && intensity[i] > intensity_threshold) {
            ms2.mz.push_back(mz[i]);
            ms2.intensity.push_back(intensity[i]);
        }
    }

    return ms2;
}

std::vector<RoiPoint> ScanList::extractIon(MZ mz, MZ mz_tol, RetentionTime rt_low,
                                           RetentionTime rt_high) const {
    std::vector<RoiPoint> eic;
    for (const Scan& scan : scans_) {
        if (scan.msLevel() != 1) continue;
        if (scan.retentionTime() > rt_high) break;
        if (scan.retentionTime() < rt_low) continue;

        RoiPoint point{scan.index(), scan.retentionTime(), 0.0, 0.0};
        bool found = false;
        MZ best = mz_tol;
        for (std::size_t i = 0; i < scan.size(); ++i) {
            MZ diff = std::abs(scan.mzAt(i) - mz);
            if (diff <= mz_tol && (!found || diff < best)) {
                found = true;
                best = diff;
                point.mz = scan.mzAt(i);
                point.intensity = scan.intensityAt(i);
            }
        }
        eic.push_back(point);
    }
    return eic;
}

} // namespace lcfeat
