/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "tdf_reader_debug.h"

Q_LOGGING_CATEGORY(TDF_READER, "tdf.reader", QtWarningMsg)
