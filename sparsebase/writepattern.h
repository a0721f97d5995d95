// This file is part of Golly.
// See docs/License.html for the copyright notice.

#ifndef WRITEPATTERN_H
#define WRITEPATTERN_H
class sparselife;

typedef enum {
   no_compression,      // write uncompressed data
   gzip_compression     // write gzip compressed data
} output_compression;

/*
 *   Save the live cells of the given universe to a text pattern file
 *   that readpattern() can load back into the same position.
 */
const char *writepattern(const char *filename,
                         const sparselife &univ,
                         output_compression compression);

#endif
