// This file is part of Golly.
// See docs/License.html for the copyright notice.

#ifndef VIEWPORT_H
#define VIEWPORT_H
/**
 *   This class holds information on how a bounded universe maps onto
 *   the user's window: every cell is drawn as a cellsize by cellsize
 *   square, with cell (0, 0) in the top left corner.
 */
class viewport {
public:
   // a cell size below 1 is treated as 1
   viewport(int gridwd, int gridht, int cellsizearg = 4) ;
   /**
    *   Convert a pixel position to a logical cell.  Returns false if
    *   the pixel is outside the grid.
    */
   bool screencell(int px, int py, int &x, int &y) const ;
   // returns an error message if n < 1
   const char *setcellsize(int n) ;
   int getcellsize() const { return cellsize ; }
   int getgridwidth() const { return gridwd ; }
   int getgridheight() const { return gridht ; }
   int getpixelwidth() const { return gridwd * cellsize ; }
   int getpixelheight() const { return gridht * cellsize ; }
private:
   int gridwd, gridht ;
   int cellsize ;
} ;
#endif
