#include "mountain_metric.hh"
#include "structure_failure.hh"

#include <cmath>
#include <cstdlib>
#include <stack>
#include <string>

namespace RnaSS {

    mountain_t
    mountain_vector(const PairedSites &paired) {
        mountain_t mountain(paired.size(), 0.0);
        for (size_type i = 0; i < paired.size(); i++) {
            if (i > 0) {
                mountain[i] = mountain[i - 1];
            }

            const site_t j = paired[i];
            if (j != PairedSites::unpaired) {
                if (j > static_cast<site_t>(i)) {
                    mountain[i] += 1.0;
                } else {
                    mountain[i] -= 1.0;
                }
            }
        }
        return mountain;
    }

    mountain_t
    weighted_mountain_vector(const PairedSites &paired) {
        mountain_t mountain(paired.size(), 0.0);
        for (size_type i = 0; i < paired.size(); i++) {
            if (i > 0) {
                mountain[i] = mountain[i - 1];
            }

            const site_t j = paired[i];
            if (j == PairedSites::unpaired)
                continue;

            // distance between site i and its partner j-1 (0-based)
            const site_t span = std::labs(j - 1 - static_cast<site_t>(i));
            if (span == 0)
                continue; // self pairs have no span

            if (j > static_cast<site_t>(i)) {
                mountain[i] += 1.0 / span;
            } else {
                mountain[i] -= 1.0 / span;
            }
        }
        return mountain;
    }

    PairedSites
    mountain_to_paired(const mountain_t &mountain) {
        PairedSites paired(mountain.size(), PairedSites::unpaired);
        std::stack<size_type> open;

        double height = 0.0;
        for (size_type i = 0; i < mountain.size(); i++) {
            const double step = mountain[i] - height;
            height = mountain[i];

            if (step == 1.0) {
                open.push(i);
            } else if (step == -1.0) {
                if (open.empty()) {
                    throw premature_closure_failure(i + 1);
                }
                const size_type k = open.top();
                open.pop();
                paired[i] = k + 1;
                paired[k] = i + 1;
            } else if (step != 0.0) {
                throw structure_failure("Invalid step of mountain vector at "
                                        "position " +
                                        std::to_string(i + 1) + ".");
            }
        }

        if (!open.empty()) {
            throw unconsumed_openings_failure(open.size());
        }
        return paired;
    }

    namespace {
        double
        vector_distance(const mountain_t &m1, const mountain_t &m2, double p) {
            double d = 0.0;
            for (size_type i = 0; i < m1.size(); i++) {
                const double diff = std::fabs(m1[i] - m2[i]);
                // equal heights contribute nothing, also for p<=0
                if (diff != 0.0) {
                    d += std::pow(diff, p);
                }
            }
            return d;
        }

        void
        check_lengths(const PairedSites &paired1, const PairedSites &paired2) {
            if (paired1.size() != paired2.size()) {
                throw unequal_length_failure(paired1.size(), paired2.size());
            }
        }
    }

    double
    mountain_distance(const PairedSites &paired1,
                      const PairedSites &paired2,
                      double p) {
        check_lengths(paired1, paired2);
        return vector_distance(mountain_vector(paired1),
                               mountain_vector(paired2),
                               p);
    }

    double
    mountain_diameter(size_type length, double p) {
        return mountain_distance(structure_star(length),
                                 structure_zero(length),
                                 p);
    }

    double
    normalised_mountain_distance(const PairedSites &paired1,
                                 const PairedSites &paired2,
                                 double p) {
        double d = mountain_distance(paired1, paired2, p);
        double diameter = mountain_diameter(paired1.size(), p);
        if (diameter == 0.0) {
            return 0.0;
        }
        return d / diameter;
    }

    double
    weighted_mountain_distance(const PairedSites &paired1,
                               const PairedSites &paired2) {
        check_lengths(paired1, paired2);
        return vector_distance(weighted_mountain_vector(paired1),
                               weighted_mountain_vector(paired2),
                               1.0);
    }

    double
    weighted_mountain_diameter(size_type length) {
        return weighted_mountain_distance(structure_star(length),
                                          structure_zero(length));
    }

    double
    normalised_weighted_mountain_distance(const PairedSites &paired1,
                                          const PairedSites &paired2) {
        double d = weighted_mountain_distance(paired1, paired2);
        double diameter = weighted_mountain_diameter(paired1.size());
        if (diameter == 0.0) {
            return 0.0;
        }
        return d / diameter;
    }

} // end namespace RnaSS
