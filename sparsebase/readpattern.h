// This file is part of Golly.
// See docs/License.html for the copyright notice.

#ifndef READPATTERN_H
#define READPATTERN_H
class sparselife ;

/*
 *   Read a text pattern file and paste it into the given universe
 *   with its top left corner at (x, y).  The file may be gzipped.
 *   'o' is a live cell, anything else is dead.  Lines starting with
 *   '!' are comments; a "#P dx dy" line moves the origin by (dx, dy);
 *   other lines starting with '#' are ignored.  Returns 0 on success
 *   or an error message.
 */
const char *readpattern(const char *filename, sparselife &univ,
                        int x = 0, int y = 0) ;

#endif
