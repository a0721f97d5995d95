// This file is part of Golly.
// See docs/License.html for the copyright notice.

/**
 *   Encapsulate a class capable of rendering a life universe.
 *   The drawing code only ever fills rectangles with a cell state
 *   (0 for the background, 1 for live cells); the renderer decides
 *   what colors those states get.  Coordinates are in pixels, with
 *   (0, 0) in the top left corner of the viewport.
 *
 *   If clipping is needed, it's the responsibility of these
 *   routines, *not* the caller.
 */
#ifndef LIFERENDER_H
#define LIFERENDER_H
class liferender {
public:
   liferender() {}
   virtual ~liferender() ;
   virtual void fill(int x, int y, int w, int h, int state) = 0 ;
   // called once a whole frame has been drawn
   virtual void flip() ;
} ;
/**
 *   Renders into a caller-owned buffer of vw*vh bytes, one byte per
 *   pixel, row by row.
 */
class staterender : public liferender {
public:
   staterender(unsigned char *_buf, int _vw, int _vh) :
               buf(_buf), vw(_vw), vh(_vh), frames(0) {}
   virtual void fill(int x, int y, int w, int h, int state) ;
   virtual void flip() { frames++ ; }
   int getframes() const { return frames ; }
private:
   unsigned char *buf ;
   int vw, vh ;
   int frames ;
} ;
#endif
