// This file is part of Golly.
// See docs/License.html for the copyright notice.

#ifndef SPARSEDRAW_H
#define SPARSEDRAW_H
class sparselife ;
class viewport ;
class liferender ;

/*
 *   Draw one frame: clear the whole viewport to the background, fill
 *   one square per live cell, then flip.
 */
void drawsparselife(const sparselife &univ, const viewport &view,
                    liferender &renderer) ;

#endif
