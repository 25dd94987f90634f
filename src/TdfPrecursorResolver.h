/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_PRECURSOR_RESOLVER_H
#define TDF_PRECURSOR_RESOLVER_H

#include "TdfScanRef.h"

_TDF_BEGIN

class TdfFrameRepository;
class TimsData;

//! Precursor of a PASEF fragmentation scan together with the values derived from it
struct TDF_READER_EXPORT ResolvedPrecursor
{
    PasefPrecursorInfo precursor;

    double isolationTargetMz = 0.0;
    double lowerWindowOffset = 0.0;
    double upperWindowOffset = 0.0;

    //! 1/K0 of the queried scan, or of ceil(ScanNumber) for combined ranges
    double inverseMobility = 0.0;

    //! "frame=<parent> startScan=.. endScan=.." covering the precursor's scan window
    QString precursorNativeId;
    QString productNativeId;

    void clear();
};

/*!
 * \brief Maps PASEF MS2 scans and scan ranges to the precursor selection that produced them
 *
 * A single scan s belongs to the first precursor with startScan <= s < endScan. A combined
 * range belongs to the one precursor whose window overlaps it; more than one overlapping
 * window is an error, the match is never guessed.
 */
class TDF_READER_EXPORT TdfPrecursorResolver
{
public:
    TdfPrecursorResolver(TdfFrameRepository *repository, TimsData *timsData);

    /*!
     * \brief Finds the precursor of @a ref among its frame's PASEF windows
     *
     * @a found is false for frames that are not PASEF MS2 and for scans outside every window.
     * \return kAmbiguousPrecursorMatch if a combined range overlaps several windows
     */
    static Err locatePrecursor(const TdfScanRef &ref, PasefPrecursorInfo *precursor, bool *found);

    /*!
     * \brief locatePrecursor() plus isolation window, inverse mobility and scan identifiers
     *
     * The parent MS1 frame is loaded through the repository.
     * \throws nothing; TimsException from the conversion is turned into its Err code
     */
    Err resolve(const TdfScanRef &ref, ResolvedPrecursor *resolved, bool *found) const;

private:
    Err inverseMobility(const TdfScanRef &ref, const PasefPrecursorInfo &precursor,
                        double *value) const;

    TdfFrameRepository *m_repository;
    TimsData *m_timsData;
};

_TDF_END

#endif // TDF_PRECURSOR_RESOLVER_H
