// This file is part of Golly.
// See docs/License.html for the copyright notice.

#include "viewport.h"

viewport::viewport(int gridwdarg, int gridhtarg, int cellsizearg) :
      gridwd(gridwdarg), gridht(gridhtarg),
      cellsize(cellsizearg < 1 ? 1 : cellsizearg) {}

const char *viewport::setcellsize(int n) {
   if (n < 1)
      return "Cell size must be at least 1." ;
   cellsize = n ;
   return 0 ;
}

bool viewport::screencell(int px, int py, int &x, int &y) const {
   // pixels left of or above the grid must not round towards zero
   if (px < 0 || py < 0)
      return false ;
   int cx = px / cellsize ;
   int cy = py / cellsize ;
   if (cx >= gridwd || cy >= gridht)
      return false ;
   x = cx ;
   y = cy ;
   return true ;
}
