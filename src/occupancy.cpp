/**
 * Occupancy Engine - Implementation
 */

#include "occupancy.hpp"
#include "sequence_utils.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace tfbs {

// ============================================================================
// Sequence scanning
// ============================================================================

double window_energy(const std::vector<uint8_t>& codes, size_t position,
                     Strand strand, const MotifMatrix& motif) {
    const Matrix& ewm = motif.ewm();
    const size_t w = ewm.size();
    double energy = 0.0;

    if (strand == Strand::FORWARD) {
        for (size_t i = 0; i < w; ++i) {
            uint8_t code = codes[position + i];
            energy += (code == BASE_AMBIGUOUS) ? motif.worst_energy(i) : ewm[i][code];
        }
    } else {
        // Column i pairs with the base w-1-i along the complement strand
        for (size_t i = 0; i < w; ++i) {
            uint8_t code = complement_code(codes[position + w - 1 - i]);
            energy += (code == BASE_AMBIGUOUS) ? motif.worst_energy(i) : ewm[i][code];
        }
    }

    return energy;
}

EnergyLandscape energy_landscape(const std::vector<uint8_t>& codes, const MotifMatrix& motif) {
    EnergyLandscape result;
    const size_t w = motif.width();
    if (codes.size() < w) {
        return result;
    }

    const size_t n_scores = codes.size() - w + 1;
    result.forward.resize(n_scores);
    result.reverse.resize(n_scores);

    for (size_t p = 0; p < n_scores; ++p) {
        result.forward[p] = window_energy(codes, p, Strand::FORWARD, motif);
        result.reverse[p] = window_energy(codes, p, Strand::REVERSE, motif);
    }

    return result;
}

EnergyLandscape energy_landscape(const std::string& sequence, const MotifMatrix& motif) {
    return energy_landscape(encode_sequence(sequence), motif);
}

// ============================================================================
// Occupancy
// ============================================================================

double occupancy(double energy, double mu) {
    const double x = energy - mu;
    if (x > 0.0) {
        const double e = std::exp(-x);
        return e / (1.0 + e);
    }
    return 1.0 / (1.0 + std::exp(x));
}

double OccupancyLandscape::expected_bound() const {
    double total = std::accumulate(forward.begin(), forward.end(), 0.0);
    return std::accumulate(reverse.begin(), reverse.end(), total);
}

double OccupancyLandscape::max_occupancy() const {
    double best = 0.0;
    for (double v : forward) best = std::max(best, v);
    for (double v : reverse) best = std::max(best, v);
    return best;
}

OccupancyLandscape occupancy_landscape(const std::vector<uint8_t>& codes,
                                       const MotifMatrix& motif, double mu) {
    EnergyLandscape energies = energy_landscape(codes, motif);

    OccupancyLandscape landscape;
    landscape.motif = motif.name();
    landscape.motif_length = motif.width();
    landscape.forward.reserve(energies.forward.size());
    landscape.reverse.reserve(energies.reverse.size());

    for (double e : energies.forward) {
        landscape.forward.push_back(occupancy(e, mu));
    }
    for (double e : energies.reverse) {
        landscape.reverse.push_back(occupancy(e, mu));
    }

    return landscape;
}

OccupancyLandscape occupancy_landscape(const std::string& sequence,
                                       const MotifMatrix& motif, double mu) {
    return occupancy_landscape(encode_sequence(sequence), motif, mu);
}

std::vector<OccupancyLandscape> total_landscape(const std::string& sequence,
                                                const MotifCollection& motifs, double mu) {
    const std::vector<uint8_t> codes = encode_sequence(sequence);

    std::vector<OccupancyLandscape> result;
    result.reserve(motifs.size());
    for (const auto& entry : motifs) {
        result.push_back(occupancy_landscape(codes, entry.second, mu));
    }
    return result;
}

// ============================================================================
// Aggregation
// ============================================================================

void sort_sites(std::vector<BindingSite>& sites) {
    std::sort(sites.begin(), sites.end(), site_order_less);
}

std::vector<BindingSite> landscape_to_sites(const std::string& label,
                                            const std::vector<OccupancyLandscape>& landscapes) {
    size_t total = 0;
    for (const auto& landscape : landscapes) {
        total += 2 * landscape.size();
    }

    std::vector<BindingSite> sites;
    sites.reserve(total);

    for (const auto& landscape : landscapes) {
        for (size_t p = 0; p < landscape.size(); ++p) {
            BindingSite fwd;
            fwd.label = label;
            fwd.position = p;
            fwd.motif = landscape.motif;
            fwd.strand = Strand::FORWARD;
            fwd.motif_length = landscape.motif_length;
            fwd.occupancy = landscape.forward[p];
            sites.push_back(std::move(fwd));

            BindingSite rev;
            rev.label = label;
            rev.position = p;
            rev.motif = landscape.motif;
            rev.strand = Strand::REVERSE;
            rev.motif_length = landscape.motif_length;
            rev.occupancy = landscape.reverse[p];
            sites.push_back(std::move(rev));
        }
    }

    sort_sites(sites);
    return sites;
}

std::vector<BindingSite> sites_above_cutoff(const std::string& label,
                                            const std::vector<OccupancyLandscape>& landscapes,
                                            double cutoff) {
    // Visit landscapes by motif name so the merge comes out in site order
    std::vector<size_t> by_name(landscapes.size());
    std::iota(by_name.begin(), by_name.end(), size_t{0});
    std::stable_sort(by_name.begin(), by_name.end(), [&](size_t a, size_t b) {
        return landscapes[a].motif < landscapes[b].motif;
    });

    size_t max_positions = 0;
    for (const auto& landscape : landscapes) {
        max_positions = std::max(max_positions, landscape.size());
    }

    std::vector<BindingSite> sites;
    auto keep = [&](const OccupancyLandscape& landscape, size_t p, Strand strand, double value) {
        BindingSite site;
        site.label = label;
        site.position = p;
        site.motif = landscape.motif;
        site.strand = strand;
        site.motif_length = landscape.motif_length;
        site.occupancy = value;
        sites.push_back(std::move(site));
    };

    for (size_t p = 0; p < max_positions; ++p) {
        for (size_t m : by_name) {
            const auto& landscape = landscapes[m];
            if (p >= landscape.size()) continue;
            if (landscape.forward[p] >= cutoff) {
                keep(landscape, p, Strand::FORWARD, landscape.forward[p]);
            }
            if (landscape.reverse[p] >= cutoff) {
                keep(landscape, p, Strand::REVERSE, landscape.reverse[p]);
            }
        }
    }

    return sites;
}

std::vector<BindingSite> filter_sites(const std::vector<BindingSite>& sites, double cutoff) {
    std::vector<BindingSite> result;
    for (const auto& site : sites) {
        if (site.occupancy >= cutoff) {
            result.push_back(site);
        }
    }
    return result;
}

DenseLandscape dense_landscape(size_t sequence_length,
                               const std::vector<OccupancyLandscape>& landscapes) {
    DenseLandscape table;
    table.columns.reserve(landscapes.size() * 2);
    for (const auto& landscape : landscapes) {
        table.columns.push_back(landscape.motif + "_F");
        table.columns.push_back(landscape.motif + "_R");
    }

    table.rows.assign(sequence_length, std::vector<double>(table.columns.size(), 0.0));
    for (size_t m = 0; m < landscapes.size(); ++m) {
        const auto& landscape = landscapes[m];
        for (size_t p = 0; p < landscape.size() && p < sequence_length; ++p) {
            table.rows[p][2 * m] = landscape.forward[p];
            table.rows[p][2 * m + 1] = landscape.reverse[p];
        }
    }

    return table;
}

// ============================================================================
// LandscapeAggregator
// ============================================================================

LandscapeAggregator::LandscapeAggregator(SharedMotifCollection motifs, const ScanParams& params)
    : motifs_(std::move(motifs)), params_(params) {
    if (!motifs_) {
        throw std::invalid_argument("LandscapeAggregator requires a motif collection");
    }
    validate_scan_params(params_);
}

std::vector<OccupancyLandscape> LandscapeAggregator::landscapes(const std::string& sequence) const {
    return total_landscape(sequence, *motifs_, params_.mu);
}

std::vector<BindingSite> LandscapeAggregator::sites(
    const std::string& label,
    const std::vector<OccupancyLandscape>& landscapes) const {
    return sites_above_cutoff(label, landscapes, params_.cutoff);
}

std::vector<BindingSite> LandscapeAggregator::scan(const std::string& label,
                                                   const std::string& sequence) const {
    return sites(label, landscapes(sequence));
}

} // namespace tfbs
