#include "reading_cleanup.hpp"

Grid dropConflictingReadings(Grid grid, Confidences confidence) {
    for (int round = 0; round < MAX_CLEANUP_ROUNDS; ++round) {
        ValidationResult v = validate(grid);
        if (v.ok) break;

        // conflicts is ordered, so the first minimum found is the lowest index
        int weakest = -1;
        for (int idx : v.conflicts) {
            if (weakest == -1 || confidence[idx] < confidence[weakest]) weakest = idx;
        }

        grid[weakest] = 0;
        confidence[weakest] = -1.0f;
    }
    return grid;
}
